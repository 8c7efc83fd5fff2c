#pragma once

#include <string_view>

#include "image.hpp"


namespace scanimate {

/// Post-pass applied to the base image before it is written.
enum class Flatten : uint8_t {
	/// Keep the alpha channel.
	none,
	/// Blend over opaque white.
	white_background,
	/// Discard alpha, keeping whatever color is stored under transparent pixels.
	drop_alpha,
	};

[[nodiscard]] auto to_string(Flatten mode) noexcept -> std::string_view;

/// Return whether images flattened with the given mode are opaque and may be stored without
/// an alpha channel.
[[nodiscard]] constexpr auto is_opaque(Flatten const mode) noexcept -> bool {
	return mode != Flatten::none;
	}


/// Blend a color over an opaque background using the over-operator.
[[nodiscard]] constexpr auto blend_over(Color const& color, Color const& background) noexcept
		-> Color {
	auto const alpha        {unsigned{color[color::alpha_channel]}};
	auto const transparency {color::channel_max - alpha};

	Color out {background};

	for (std::size_t i {0}; i < color::alpha_channel; ++i) {
		out[i] = static_cast<color::Channel>(
				(color[i] * alpha + background[i] * transparency + color::channel_max / 2)
				/ color::channel_max);
		}

	out[color::alpha_channel] = color::channel_max;
	return out;
	}

/// Composite an image over a solid opaque background.
[[nodiscard]] auto composite_over(Image image, Color const& background) -> Image;

/// Set every pixel's alpha to opaque without touching its color.
/// Transparent regions show the color stored under them, which is black for pixels that were
/// never written (see `colors::transparent`), not white.
[[nodiscard]] auto drop_alpha(Image image) -> Image;

/// Apply a post-pass.
[[nodiscard]] auto flatten(Image image, Flatten mode) -> Image;

} // namespace scanimate
