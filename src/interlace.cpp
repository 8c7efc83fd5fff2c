#include "interlace.hpp"

#include <algorithm>


namespace scanimate {

auto interlace(std::span<Image const> const frames, Geometry const& geometry) -> Image {
	geometry.validate();

	if (frames.size() != geometry.num_frames) {
		throw Error{ErrorKind::insufficient_frames, concat(
				"Geometry expects ", geometry.num_frames, " frames, got ", frames.size())};
		}

	for (std::size_t i {0}; i < frames.size(); ++i) {
		if (frames[i].width() != geometry.width or frames[i].height() != geometry.height) {
			throw Error{ErrorKind::invalid_geometry, concat(
					"Frame #", i, " is ", frames[i].width(), "x", frames[i].height(),
					", expected ", geometry.width, "x", geometry.height)};
			}}

	auto const axis  {geometry.stripe_axis()};
	auto const slice {std::clamp<ImageSize>(geometry.slice, 1, axis)};

	Image out {geometry.width, geometry.height};

	for_each_stripe(axis, slice, [&](
			ImageSize const   begin,
			ImageSize const   end,
			std::size_t const idx
			) {
		auto const& frame {frames[idx % frames.size()]};

		switch (geometry.direction) {
			case Direction::vertical:
				out.copy_columns(frame, begin, end);
				break;
			case Direction::horizontal:
				out.copy_rows(frame, begin, end);
				break;
				}
		});

	return out;
	}

} // namespace scanimate
