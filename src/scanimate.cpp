#include <iostream>
#include <optional>

#include "args.hpp"
#include "run.hpp"


/// Interlace the frames found in a folder into a scanimation base image, and optionally write
/// the matching grille mask.
/// Run with `--help` for the list of options.
auto main(int argc, char* argv[]) -> int {
	using namespace scanimate;
	return try_main([&]() {

	auto const program {argc >= 1 ? argv[0] : "scanimate"};

	// Parse command line arguments.
	auto const args {[&]() -> std::optional<Args> {
		try {
			return Args{argc, argv};
			}
		catch (Error const& error) {
			std::cerr << log_sev_fatal << error.what() << "\n";
			print_usage(std::cerr, program);
			return std::nullopt;
			}}()};

	if (not args) {
		return EXIT_FAILURE;
		}

	if (args->help) {
		print_usage(std::cout, program);
		return EXIT_SUCCESS;
		}

	return run(*args);
	});
	}
