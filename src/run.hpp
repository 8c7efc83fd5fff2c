#pragma once

#include "args.hpp"


namespace scanimate {

/// Collect, decode and encode the frames named by `args`, then write the base image and, if
/// requested, the mask.
///
/// Input-side failures throw before any output file is touched. The two outputs are written
/// independently: a failed write is logged and does not prevent the other one.
/// Returns `EXIT_SUCCESS`, or `EXIT_FAILURE` if any write failed.
[[nodiscard]] auto run(Args const& args) -> int;

} // namespace scanimate
