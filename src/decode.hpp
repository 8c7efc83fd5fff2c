#pragma once

#include <filesystem>

#include "image.hpp"


namespace scanimate {

/// Decode an image file of any supported format into 8-bit RGBA.
/// PNG files are read with png++, everything else (JPEG, WebP, BMP, GIF, TIFF, ...) through
/// OpenImageIO. Of multi-image files only the first image is read.
/// Throws `ErrorKind::frame_decode_failure` naming the file.
[[nodiscard]] auto read_frame(std::filesystem::path const& path) -> Image;

} // namespace scanimate
