#include "common.hpp"


namespace scanimate {

auto to_string(ErrorKind const kind) noexcept -> std::string_view {
	switch (kind) {
		case ErrorKind::insufficient_frames:  return "insufficient frames";
		case ErrorKind::frame_decode_failure: return "frame decode failure";
		case ErrorKind::invalid_geometry:     return "invalid geometry";
		case ErrorKind::invalid_argument:     return "invalid argument";
		case ErrorKind::input_not_found:      return "input not found";
		case ErrorKind::output_failure:       return "output failure";
		}

	return "unknown error";
	}

} // namespace scanimate
