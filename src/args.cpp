#include "args.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

#include "frames.hpp"


namespace scanimate {

namespace {

[[nodiscard]] auto parse_slice(std::string_view const text) -> ImageSize {
	long long value {0};
	auto const [end, error] {std::from_chars(text.data(), text.data() + text.size(), value)};

	if (error != std::errc{} or end != text.data() + text.size()) {
		throw Error{ErrorKind::invalid_argument, concat(
				"Slice size `", text, "` is not an integer")};
		}

	if (value < 1 or value > std::numeric_limits<ImageSize>::max()) {
		throw Error{ErrorKind::invalid_geometry, concat(
				"Slice size must be a positive number of pixels, got ", value)};
		}

	return static_cast<ImageSize>(value);
	}

[[nodiscard]] auto parse_direction(std::string_view const text) -> Direction {
	if (text == "vertical") {
		return Direction::vertical;
		}
	if (text == "horizontal") {
		return Direction::horizontal;
		}

	throw Error{ErrorKind::invalid_argument, concat(
			"Unknown direction '", text, "'. Must be either 'vertical' or 'horizontal'.")};
	}

[[nodiscard]] auto parse_resize(std::string_view const text) -> ResizeStrategy {
	if (text == "first") {
		return ResizeStrategy::first;
		}
	if (text == "min") {
		return ResizeStrategy::min;
		}

	throw Error{ErrorKind::invalid_argument, concat(
			"Unknown resize strategy '", text, "'. Must be either 'first' or 'min'.")};
	}

/// Replace a leading `~` with the home directory, as a shell would.
[[nodiscard]] auto expand_home(std::string_view const text) -> std::filesystem::path {
	if (text != "~" and not text.starts_with("~/")) {
		return text;
		}

	auto const* const home {std::getenv("HOME")};

	if (home == nullptr or *home == '\0') {
		return text;
		}

	if (text == "~") {
		return home;
		}

	return std::filesystem::path{home} / text.substr(2);
	}

} // namespace


Args::Args(int const argc, char const* const argv[])
	: extensions {parse_extensions(default_extensions)}
	{
	auto force_rgb {false};
	auto white_bg  {false};

	for (auto argi {1}; argi < argc; ++argi) {
		std::string_view                option {argv[argi]};
		std::optional<std::string_view> inline_value;

		// Accept `--option=value` as well as `--option value`.
		if (auto const eq {option.find('=')}; option.starts_with("--") and eq != option.npos) {
			inline_value = option.substr(eq + 1);
			option       = option.substr(0, eq);
			}

		auto const value {[&]() -> std::string_view {
			if (inline_value) {
				return *inline_value;
				}

			if (argi + 1 >= argc) {
				throw Error{ErrorKind::invalid_argument, concat("Missing value for ", option)};
				}

			return argv[++argi];
			}};

		auto const flag {[&]() -> bool {
			if (inline_value) {
				throw Error{ErrorKind::invalid_argument, concat(
						"Option ", option, " does not take a value")};
				}

			return true;
			}};

		if (option == "--dir") {
			dir = expand_home(value());
			}
		else if (option == "--recursive") {
			recursive = flag();
			}
		else if (option == "--exts") {
			extensions = parse_extensions(value());
			}
		else if (option == "--slice") {
			settings.slice = parse_slice(value());
			}
		else if (option == "--direction") {
			settings.direction = parse_direction(value());
			}
		else if (option == "--resize") {
			settings.resize = parse_resize(value());
			}
		else if (option == "--out-base") {
			out_base = expand_home(value());
			}
		else if (option == "--out-mask") {
			out_mask = expand_home(value());
			}
		else if (option == "--force-rgb") {
			force_rgb = flag();
			}
		else if (option == "--white-bg") {
			white_bg = flag();
			}
		else if (option == "--help" or option == "-h") {
			help = flag();
			}
		else {
			throw Error{ErrorKind::invalid_argument, concat("Unknown argument '", option, "'")};
			}}

	if (extensions.empty()) {
		throw Error{ErrorKind::invalid_argument, "No file extensions given"};
		}

	if (out_base.empty() or (out_mask and out_mask->empty())) {
		throw Error{ErrorKind::invalid_argument, "Output paths must not be empty"};
		}

	// Compositing onto white takes precedence, it yields an opaque image either way.
	if (white_bg) {
		settings.flatten = Flatten::white_background;
		}
	else if (force_rgb) {
		settings.flatten = Flatten::drop_alpha;
		}}

auto print_usage(std::ostream& out, std::string_view const program) -> void {
	out << "Usage: " << program << " [options]\n"
	       "Interlace the frames in a folder into a scanimation base image.\n"
	       "\n"
	       "  --dir <path>           Folder containing frames, a leading ~ is your home folder\n"
	       "                         (default: .)\n"
	       "  --recursive            Recurse into subfolders\n"
	       "  --exts <list>          Comma-separated extensions to include (default: "
	    << default_extensions << ")\n"
	       "  --slice <px>           Stripe and slit size in pixels (default: 1)\n"
	       "  --direction <dir>      'vertical' (slide left-right) or 'horizontal' (slide up-down)\n"
	       "                         (default: vertical)\n"
	       "  --resize <strategy>    'first' to match the first frame, 'min' to fit the smallest\n"
	       "                         width and height (default: first)\n"
	       "  --out-base <path>      Output file for the base image (default: scanimation_base.png)\n"
	       "  --out-mask <path>      Also write the matching grille mask (PNG with alpha)\n"
	       "  --force-rgb            Drop the alpha channel of the base image\n"
	       "  --white-bg             Composite the base image onto a white background\n"
	       "  --help                 Show this text\n";
	}

} // namespace scanimate
