#include "image.hpp"

#include <algorithm>


namespace scanimate {

Image::Image(ImageSize const width, ImageSize const height, Color const fill)
	: _width  {width}
	, _height {height}
	, _pixels (std::size_t{width} * height, fill)
	{}

auto Image::fill_columns(ImageSize x_begin, ImageSize x_end, Color const color) noexcept -> void {
	x_end   = std::min(x_end, _width);
	x_begin = std::min(x_begin, x_end);

	for (ImageSize y {0}; y < _height; ++y) {
		auto const line {row(y)};
		std::fill(line.begin() + x_begin, line.begin() + x_end, color);
		}}

auto Image::fill_rows(ImageSize y_begin, ImageSize y_end, Color const color) noexcept -> void {
	y_end   = std::min(y_end, _height);
	y_begin = std::min(y_begin, y_end);

	std::fill(
			_pixels.begin() + std::size_t{y_begin} * _width,
			_pixels.begin() + std::size_t{y_end} * _width,
			color
			);
	}

auto Image::copy_columns(Image const& src, ImageSize x_begin, ImageSize x_end) -> void {
	require_same_size(src);

	x_end   = std::min(x_end, _width);
	x_begin = std::min(x_begin, x_end);

	for (ImageSize y {0}; y < _height; ++y) {
		auto const in_row {src.row(y)};
		std::copy(in_row.begin() + x_begin, in_row.begin() + x_end, row(y).begin() + x_begin);
		}}

auto Image::copy_rows(Image const& src, ImageSize y_begin, ImageSize y_end) -> void {
	require_same_size(src);

	y_end   = std::min(y_end, _height);
	y_begin = std::min(y_begin, y_end);

	auto const offset {[&](ImageSize const y) {
		return static_cast<std::ptrdiff_t>(std::size_t{y} * _width);
		}};

	std::copy(
			src._pixels.begin() + offset(y_begin),
			src._pixels.begin() + offset(y_end),
			_pixels.begin() + offset(y_begin)
			);
	}

auto Image::require_same_size(Image const& src) const -> void {
	if (not same_size(src)) {
		throw Error{ErrorKind::invalid_geometry, concat(
				"Cannot copy pixels from a ", src.width(), "x", src.height(), " image into a ",
				_width, "x", _height, " image"
				)};
		}}

} // namespace scanimate
