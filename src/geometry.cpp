#include "geometry.hpp"


namespace scanimate {

auto to_string(Direction const direction) noexcept -> std::string_view {
	switch (direction) {
		case Direction::vertical:   return "vertical";
		case Direction::horizontal: return "horizontal";
		}

	return "unknown";
	}

auto Geometry::validate() const -> void {
	if (width == 0 or height == 0) {
		throw Error{ErrorKind::invalid_geometry, concat(
				"Image dimensions must be positive, got ", width, "x", height)};
		}

	if (num_frames == 0) {
		throw Error{ErrorKind::insufficient_frames, "At least one frame is required"};
		}}

} // namespace scanimate
