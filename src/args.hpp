#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "scanimation.hpp"


namespace scanimate {

/// Extensions collected when `--exts` is not given.
constexpr std::string_view default_extensions {"png,jpg,jpeg,webp,bmp,gif,tif,tiff"};

/// Command line configuration of the `scanimate` executable.
struct Args {
	std::filesystem::path                dir        {"."};
	bool                                 recursive  {false};
	std::vector<std::string>             extensions {};
	Settings                             settings   {};
	std::filesystem::path                out_base   {"scanimation_base.png"};
	std::optional<std::filesystem::path> out_mask   {};
	bool                                 help       {false};

	/// Parse arguments, throwing `ErrorKind::invalid_argument` on malformed input and
	/// `ErrorKind::invalid_geometry` on a non-positive slice.
	[[nodiscard]] Args(int argc, char const* const argv[]);

	};

/// Print the usage text.
auto print_usage(std::ostream& out, std::string_view program) -> void;

} // namespace scanimate
