#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>


/// Functionality shared by the scanimate library and executable.
namespace scanimate {

// Logging constants.
constexpr std::string_view log_sev_info  {      "\x1b[1m[info]\x1b[m  "};
constexpr std::string_view log_sev_warn  {   "\x1b[1;33m[warn]\x1b[m  "};
constexpr std::string_view log_sev_error {   "\x1b[1;31m[error]\x1b[m "};
constexpr std::string_view log_sev_fatal {"\x1b[1;30;41m[fatal]\x1b[m "};


/// Cast between integer types, asserting that the given value can be represented in both.
template<std::integral TTo, std::integral TFrom>
constexpr auto int_cast(TFrom const& value) -> TTo {
	using BitUnion = std::make_unsigned_t<std::common_type_t<TTo, TFrom>>;

	// Assert that only bits shared between both types are set.
	assert(static_cast<BitUnion>(value) < BitUnion{1} << std::min(
			std::numeric_limits<TTo>::digits,
			std::numeric_limits<TFrom>::digits
			));

	return static_cast<TTo>(value);
	}


/// Concatenate arguments into a string using a string stream for formatting.
template<typename... TArgs>
auto concat(TArgs const&... args) -> std::string {
	std::ostringstream result;
	(result << ... << args);
	return std::move(result).str();
	}


/// Classifies the errors that abort a run.
enum class ErrorKind : uint8_t {
	insufficient_frames,
	frame_decode_failure,
	invalid_geometry,
	invalid_argument,
	input_not_found,
	output_failure,
	};

/// Return a short human readable name for an error kind.
[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// An error that is fatal to the current run.
class Error : public std::runtime_error {
public:
	[[nodiscard]] Error(ErrorKind const kind, std::string const& message)
		: std::runtime_error {message}
		, _kind              {kind}
		{}

	[[nodiscard]] constexpr auto kind() const noexcept -> ErrorKind {
		return _kind;
		}

private:
	ErrorKind _kind;
	};


/// Wraps a main function with pretty printing for exceptions.
template<typename Fn>
	requires std::is_invocable_r_v<int, Fn>
auto try_main(Fn&& fn) -> int {
	try {
		return fn();
		}
	catch (Error const& error) {
		std::cerr << log_sev_fatal << to_string(error.kind()) << ": " << error.what() << "\n";
		return EXIT_FAILURE;
		}
	catch (std::exception const& error) {
		std::cerr << log_sev_fatal << error.what() << "\n";
		return EXIT_FAILURE;
		}
	catch (...) {
		std::cerr << log_sev_fatal << "Unknown error\n";
		return EXIT_FAILURE;
		}}

} // namespace scanimate
