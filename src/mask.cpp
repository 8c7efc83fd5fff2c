#include "mask.hpp"


namespace scanimate {

auto make_mask(Geometry const& geometry) -> Image {
	geometry.validate();

	Image out {geometry.width, geometry.height, colors::black};

	auto const slice {std::max<ImageSize>(geometry.slice, 1)};

	// Only the first stripe of each period is a slit.
	for_each_stripe(geometry.stripe_axis(), slice, [&](
			ImageSize const   begin,
			ImageSize const   end,
			std::size_t const idx
			) {
		if (idx % geometry.num_frames != 0) {
			return;
			}

		switch (geometry.direction) {
			case Direction::vertical:
				out.fill_columns(begin, end, colors::transparent);
				break;
			case Direction::horizontal:
				out.fill_rows(begin, end, colors::transparent);
				break;
				}
		});

	return out;
	}

} // namespace scanimate
