#include "png_io.hpp"

#include <png++/png.hpp>


namespace scanimate {

namespace {

namespace fs = std::filesystem;

using PngPixel = png::basic_rgba_pixel<color::Channel>;
using Png      = png::image<PngPixel, png::solid_pixel_buffer<PngPixel>>;
using RgbPixel = png::basic_rgb_pixel<color::Channel>;
using RgbPng   = png::image<RgbPixel, png::solid_pixel_buffer<RgbPixel>>;
using PngSize  = decltype(std::declval<Png>().get_width());

/// Copy an image into a png++ image of the given pixel type.
template<typename TPng, typename TConvert>
auto encode(Image const& image, fs::path const& path, TConvert&& convert) -> void {
	TPng png {int_cast<PngSize>(image.width()), int_cast<PngSize>(image.height())};

	for (ImageSize y {0}; y < image.height(); ++y) {
		for (ImageSize x {0}; x < image.width(); ++x) {
			png.set_pixel(x, y, convert(image(x, y)));
			}}

	png.write(path.string());
	}

} // namespace


auto read_png(fs::path const& path) -> Image {
	try {
		Png const png {path.string()};

		Image out {int_cast<ImageSize>(png.get_width()), int_cast<ImageSize>(png.get_height())};

		for (ImageSize y {0}; y < out.height(); ++y) {
			for (ImageSize x {0}; x < out.width(); ++x) {
				auto const pixel {png.get_pixel(x, y)};
				out(x, y) = {pixel.red, pixel.green, pixel.blue, pixel.alpha};
				}}

		return out;
		}
	catch (std::exception const& error) {
		throw Error{ErrorKind::frame_decode_failure, concat(
				"Failed to open image ", path, " (", error.what(), ")")};
		}}

auto write_png(Image const& image, fs::path const& path, PixelFormat const format) -> void {
	try {
		if (path.has_parent_path()) {
			fs::create_directories(path.parent_path());
			}

		switch (format) {
			case PixelFormat::rgba:
				encode<Png>(image, path, [](Color const& color) {
					return PngPixel{color[0], color[1], color[2], color[color::alpha_channel]};
					});
				break;
			case PixelFormat::rgb:
				encode<RgbPng>(image, path, [](Color const& color) {
					return RgbPixel{color[0], color[1], color[2]};
					});
				break;
				}}
	catch (std::exception const& error) {
		throw Error{ErrorKind::output_failure, concat(
				"Failed to write image ", path, " (", error.what(), ")")};
		}}

} // namespace scanimate
