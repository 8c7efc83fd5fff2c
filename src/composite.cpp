#include "composite.hpp"

#include <algorithm>


namespace scanimate {

auto to_string(Flatten const mode) noexcept -> std::string_view {
	switch (mode) {
		case Flatten::none:             return "none";
		case Flatten::white_background: return "white-background";
		case Flatten::drop_alpha:       return "drop-alpha";
		}

	return "unknown";
	}

auto composite_over(Image image, Color const& background) -> Image {
	// Only an opaque background yields an opaque result.
	auto opaque_background {background};
	opaque_background[color::alpha_channel] = color::channel_max;

	for (auto& pixel : image.pixels()) {
		pixel = blend_over(pixel, opaque_background);
		}

	return image;
	}

auto drop_alpha(Image image) -> Image {
	for (auto& pixel : image.pixels()) {
		pixel[color::alpha_channel] = color::channel_max;
		}

	return image;
	}

auto flatten(Image image, Flatten const mode) -> Image {
	switch (mode) {
		case Flatten::none:             return image;
		case Flatten::white_background: return composite_over(std::move(image), colors::white);
		case Flatten::drop_alpha:       return drop_alpha(std::move(image));
		}

	throw Error{ErrorKind::invalid_argument, "Unknown flatten mode"};
	}

} // namespace scanimate
