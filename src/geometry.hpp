#pragma once

#include <cstddef>
#include <string_view>

#include "image.hpp"


namespace scanimate {

/// Orientation of the stripes in the base image and the slits in the mask.
enum class Direction : uint8_t {
	/// Stripes are columns; the grille slides left to right.
	vertical,
	/// Stripes are rows; the grille slides top to bottom.
	horizontal,
	};

[[nodiscard]] auto to_string(Direction direction) noexcept -> std::string_view;


/// Shared parameters of a base image and its matching mask.
/// Both must be generated from identical geometry to line up physically.
struct Geometry {
	ImageSize   width      {0};
	ImageSize   height     {0};
	ImageSize   slice      {1};
	std::size_t num_frames {0};
	Direction   direction  {Direction::vertical};

	/// Return the length of the axis the stripes are laid out along.
	[[nodiscard]] constexpr auto stripe_axis() const noexcept -> ImageSize {
		return direction == Direction::vertical ? width : height;
		}

	/// Return the distance after which the stripe pattern repeats.
	[[nodiscard]] constexpr auto period() const noexcept -> std::size_t {
		return std::size_t{std::max<ImageSize>(slice, 1)} * num_frames;
		}

	/// Throw if an image dimension is zero or there are no frames.
	/// A zero slice is tolerated and treated as 1.
	auto validate() const -> void;

	[[nodiscard]] auto operator==(Geometry const&) const noexcept -> bool = default;
	};


/// Invoke `fn(begin, end, index)` for each stripe of the given width along an axis of the given
/// length. The last stripe is truncated to the axis.
template<typename Fn>
	requires std::is_invocable_v<Fn, ImageSize, ImageSize, std::size_t>
constexpr auto for_each_stripe(ImageSize const length, ImageSize const width, Fn&& fn) -> void {
	assert(width > 0);

	std::size_t index {0};

	for (ImageSize begin {0}; begin < length; ++index) {
		auto const end {length - begin > width ? begin + width : length};
		fn(begin, end, index);
		begin = end;
		}}

} // namespace scanimate
