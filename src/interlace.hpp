#pragma once

#include <span>

#include "geometry.hpp"


namespace scanimate {

/// Build a base image by cycling through the frames stripe by stripe.
/// The stripe starting at position `p` along the stripe axis is copied from frame
/// `p / slice % frames.size()`, where the slice is clamped to `[1, axis length]`.
/// All frames must have the size given by the geometry.
[[nodiscard]] auto interlace(std::span<Image const> frames, Geometry const& geometry) -> Image;

} // namespace scanimate
