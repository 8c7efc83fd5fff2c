#include "decode.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include <OpenImageIO/imageio.h>

#include "png_io.hpp"


namespace scanimate {

namespace {

namespace fs = std::filesystem;

using OIIO::ImageInput;
using OIIO::ImageSpec;
using OIIO::TypeDesc;

[[nodiscard]] auto is_png(fs::path const& path) -> bool {
	auto ext {path.extension().string()};
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char const c) {
			return static_cast<char>(std::tolower(c));
			});
	return ext == ".png";
	}

[[noreturn]] auto decode_failure(fs::path const& path, std::string const& reason) -> void {
	throw Error{ErrorKind::frame_decode_failure, concat(
			"Failed to open image ", path, " (", reason, ")")};
	}

/// Decode through OpenImageIO, converting to 8 bits per channel.
auto read_oiio(fs::path const& path) -> Image {
	// Keep straight alpha, OpenImageIO premultiplies by default.
	ImageSpec config;
	config.attribute("oiio:UnassociatedAlpha", 1);

	auto const input {ImageInput::open(path.string(), &config)};

	if (not input) {
		decode_failure(path, OIIO::geterror());
		}

	auto const& spec {input->spec()};

	if (spec.width <= 0 or spec.height <= 0 or spec.nchannels <= 0) {
		decode_failure(path, concat(
				"unsupported layout ", spec.width, "x", spec.height, "x", spec.nchannels));
		}

	auto const width     {int_cast<ImageSize>(spec.width)};
	auto const height    {int_cast<ImageSize>(spec.height)};
	auto const nchannels {int_cast<std::size_t>(spec.nchannels)};

	std::vector<color::Channel> buffer(std::size_t{width} * height * nchannels);

	if (not input->read_image(0, 0, 0, spec.nchannels, TypeDesc::UINT8, buffer.data())) {
		decode_failure(path, input->geterror());
		}

	Image out {width, height};
	auto  src {buffer.cbegin()};

	for (auto& pixel : out.pixels()) {
		switch (nchannels) {
			// Gray.
			case 1:
				pixel = {src[0], src[0], src[0], color::channel_max};
				break;
			// Gray and alpha.
			case 2:
				pixel = {src[0], src[0], src[0], src[1]};
				break;
			case 3:
				pixel = {src[0], src[1], src[2], color::channel_max};
				break;
			// Extra channels beyond alpha are ignored.
			default:
				pixel = {src[0], src[1], src[2], src[3]};
				break;
			}

		src += static_cast<std::ptrdiff_t>(nchannels);
		}

	return out;
	}

} // namespace


auto read_frame(fs::path const& path) -> Image {
	if (is_png(path)) {
		return read_png(path);
		}

	return read_oiio(path);
	}

} // namespace scanimate
