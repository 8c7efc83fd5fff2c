#include "run.hpp"

#include <cstdlib>
#include <iostream>

#include "frames.hpp"
#include "mask.hpp"
#include "png_io.hpp"


namespace scanimate {

namespace {

namespace fs = std::filesystem;

/// Format a list of extensions for messages.
auto join(std::vector<std::string> const& items) -> std::string {
	std::string result;

	for (auto const& item : items) {
		if (not result.empty()) {
			result += ',';
			}
		result += item;
		}

	return result;
	}

} // namespace


auto run(Args const& args) -> int {
	// Collect input frames.
	auto const dir   {fs::absolute(args.dir)};
	auto const files {collect_files(dir, args.extensions, args.recursive)};

	if (files.size() < 2) {
		throw Error{ErrorKind::insufficient_frames, concat(
				"Found ", files.size(), " image(s) in ", dir, " with extensions ",
				join(args.extensions), ". Need at least 2.")};
		}

	std::clog << log_sev_info << "Collected " << files.size() << " frame(s) from " << dir << ":\n";

	for (auto const& file : files) {
		std::clog << "  - " << file.filename().string() << "\n";
		}

	// Encode.
	auto const result {build(load_frames(files), args.settings)};
	auto const& geom  {result.geometry};

	for (auto const& frame : result.resampled) {
		std::clog << log_sev_warn << "Stretched " << files[frame.index].filename().string()
		          << " from " << frame.width << "x" << frame.height
		          << " to " << geom.width << "x" << geom.height << " px.\n";
		}

	auto status {EXIT_SUCCESS};

	try {
		write_png(
				result.base,
				args.out_base,
				is_opaque(args.settings.flatten) ? PixelFormat::rgb : PixelFormat::rgba
				);

		std::clog << log_sev_info << "Base saved -> " << args.out_base
		          << " (size: " << geom.width << "x" << geom.height
		          << ", frames: " << geom.num_frames
		          << ", slice: " << geom.slice
		          << ", dir: " << to_string(geom.direction)
		          << ", flatten: " << to_string(args.settings.flatten) << ")\n";
		}
	catch (Error const& error) {
		std::cerr << log_sev_error << error.what() << "\n";
		status = EXIT_FAILURE;
		}

	if (args.out_mask) {
		try {
			// The mask must keep its transparent slits.
			write_png(make_mask(geom), *args.out_mask, PixelFormat::rgba);

			std::clog << log_sev_info << "Mask saved -> " << *args.out_mask
			          << " (period: " << geom.period() << " px)\n";
			}
		catch (Error const& error) {
			std::cerr << log_sev_error << error.what() << "\n";
			status = EXIT_FAILURE;
			}}

	return status;
	}

} // namespace scanimate
