#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "image.hpp"


namespace scanimate {

/// Split a comma separated list of file extensions.
/// Entries are trimmed, lower-cased and stripped of a leading dot; empty entries are dropped.
[[nodiscard]] auto parse_extensions(std::string_view list) -> std::vector<std::string>;

/// Order strings so that embedded numbers compare by value, e.g. `frame2` before `frame10`.
[[nodiscard]] auto natural_less(std::string_view lhs, std::string_view rhs) noexcept -> bool;

/// List the regular files in a folder whose extension is in the given set, compared
/// case-insensitively, in natural order of their file names.
[[nodiscard]] auto collect_files(
		std::filesystem::path const& dir,
		std::span<std::string const> extensions,
		bool                         recursive
		) -> std::vector<std::filesystem::path>;

/// Decode the given files in order.
/// Aborts on the first file that cannot be decoded.
[[nodiscard]] auto load_frames(std::span<std::filesystem::path const> files)
		-> std::vector<Image>;

} // namespace scanimate
