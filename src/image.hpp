#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "common.hpp"


namespace scanimate {

// Image format.
namespace color {
using Channel = uint8_t;

constexpr uint8_t alpha_channel {3};
constexpr Channel channel_max   {std::numeric_limits<Channel>::max()};
};

using Color     = std::array<color::Channel, 4>;
using ImageSize = uint32_t;

namespace colors {
constexpr Color transparent {0, 0, 0, 0};
constexpr Color black       {0, 0, 0, color::channel_max};
constexpr Color white       {color::channel_max, color::channel_max, color::channel_max, color::channel_max};
};


/// A row-major RGBA pixel buffer with 8 bits per channel.
class Image {
public:
	[[nodiscard]] Image() noexcept = default;

	/// Allocate an image of the given size filled with a single color.
	[[nodiscard]] Image(ImageSize width, ImageSize height, Color fill = colors::transparent);

	[[nodiscard]] constexpr auto width() const noexcept -> ImageSize {
		return _width;
		}

	[[nodiscard]] constexpr auto height() const noexcept -> ImageSize {
		return _height;
		}

	[[nodiscard]] constexpr auto num_pixels() const noexcept -> std::size_t {
		return std::size_t{_width} * _height;
		}

	[[nodiscard]] constexpr auto empty() const noexcept -> bool {
		return _width == 0 or _height == 0;
		}

	/// Return whether both images have the same dimensions.
	[[nodiscard]] constexpr auto same_size(Image const& other) const noexcept -> bool {
		return _width == other._width and _height == other._height;
		}

	[[nodiscard]] auto operator()(ImageSize const x, ImageSize const y) noexcept -> Color& {
		return _pixels[std::size_t{y} * _width + x];
		}

	[[nodiscard]] auto operator()(ImageSize const x, ImageSize const y) const noexcept
			-> Color const& {
		return _pixels[std::size_t{y} * _width + x];
		}

	[[nodiscard]] auto row(ImageSize const y) noexcept -> std::span<Color> {
		return std::span{_pixels}.subspan(std::size_t{y} * _width, _width);
		}

	[[nodiscard]] auto row(ImageSize const y) const noexcept -> std::span<Color const> {
		return std::span{_pixels}.subspan(std::size_t{y} * _width, _width);
		}

	[[nodiscard]] auto pixels() noexcept -> std::span<Color> {
		return _pixels;
		}

	[[nodiscard]] auto pixels() const noexcept -> std::span<Color const> {
		return _pixels;
		}

	/// Set the columns `[x_begin, x_end)` of every row to a color.
	/// The range is clamped to the image.
	auto fill_columns(ImageSize x_begin, ImageSize x_end, Color color) noexcept -> void;

	/// Set the rows `[y_begin, y_end)` to a color.
	/// The range is clamped to the image.
	auto fill_rows(ImageSize y_begin, ImageSize y_end, Color color) noexcept -> void;

	/// Copy the columns `[x_begin, x_end)` of every row from an image of the same size.
	auto copy_columns(Image const& src, ImageSize x_begin, ImageSize x_end) -> void;

	/// Copy the rows `[y_begin, y_end)` from an image of the same size.
	auto copy_rows(Image const& src, ImageSize y_begin, ImageSize y_end) -> void;

	[[nodiscard]] auto operator==(Image const&) const noexcept -> bool = default;

private:
	ImageSize          _width  {0};
	ImageSize          _height {0};
	std::vector<Color> _pixels {};

	auto require_same_size(Image const& src) const -> void;

	};

} // namespace scanimate
