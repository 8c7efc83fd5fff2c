#pragma once

#include <vector>

#include "composite.hpp"
#include "geometry.hpp"
#include "unify.hpp"


namespace scanimate {

/// Parameters of the encoding.
struct Settings {
	ImageSize      slice     {1};
	Direction      direction {Direction::vertical};
	ResizeStrategy resize    {ResizeStrategy::first};
	Flatten        flatten   {Flatten::none};
	};

/// A finished base image and the geometry needed to build its mask.
struct Scanimation {
	Image                  base;
	Geometry               geometry;
	/// Input frames that were stretched to the common size.
	std::vector<Resampled> resampled {};
	};

/// Unify, interlace and flatten a sequence of frames given in reveal order.
[[nodiscard]] auto build(std::vector<Image> frames, Settings const& settings) -> Scanimation;

} // namespace scanimate
