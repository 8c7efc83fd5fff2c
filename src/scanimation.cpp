#include "scanimation.hpp"

#include "interlace.hpp"


namespace scanimate {

auto build(std::vector<Image> frames, Settings const& settings) -> Scanimation {
	auto unified {unify_sizes(std::move(frames), settings.resize)};

	Geometry const geometry {
			.width      = unified.width,
			.height     = unified.height,
			.slice      = settings.slice,
			.num_frames = unified.frames.size(),
			.direction  = settings.direction,
			};

	auto base {interlace(unified.frames, geometry)};

	return {flatten(std::move(base), settings.flatten), geometry, std::move(unified.resampled)};
	}

} // namespace scanimate
