#pragma once

#include "geometry.hpp"


namespace scanimate {

/// Build the grille matching a base image of the same geometry.
/// The mask is opaque black except for transparent slits one slice wide, repeating every
/// `slice * num_frames` pixels from the origin and spanning the full orthogonal dimension.
[[nodiscard]] auto make_mask(Geometry const& geometry) -> Image;

} // namespace scanimate
