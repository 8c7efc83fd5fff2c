#pragma once

#include <filesystem>

#include "image.hpp"


namespace scanimate {

/// Channel layout of an encoded PNG.
enum class PixelFormat : uint8_t {
	rgba,
	rgb,
	};

/// Decode a PNG file into an RGBA image.
/// Palette, grayscale and 16-bit images are converted to 8-bit RGBA.
[[nodiscard]] auto read_png(std::filesystem::path const& path) -> Image;

/// Encode an image as PNG, creating missing parent directories.
/// With `PixelFormat::rgb` the alpha channel is discarded.
auto write_png(Image const& image, std::filesystem::path const& path, PixelFormat format) -> void;

} // namespace scanimate
