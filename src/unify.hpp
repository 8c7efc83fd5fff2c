#pragma once

#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "image.hpp"


namespace scanimate {

/// How the common frame size is chosen.
enum class ResizeStrategy : uint8_t {
	/// Use the size of the first frame.
	first,
	/// Use the smallest width and the smallest height, each taken independently.
	min,
	};

[[nodiscard]] auto to_string(ResizeStrategy strategy) noexcept -> std::string_view;


/// A frame that had to be resampled, with its size before resampling.
struct Resampled {
	std::size_t index  {0};
	ImageSize   width  {0};
	ImageSize   height {0};

	auto operator==(Resampled const&) const -> bool = default;
	};

/// Frames sharing a single size.
struct UnifiedFrames {
	std::vector<Image>     frames;
	ImageSize              width     {0};
	ImageSize              height    {0};
	/// Frames that did not already have the target size, in input order.
	std::vector<Resampled> resampled {};
	};


/// Return the size all frames are unified to.
[[nodiscard]] auto target_size(std::span<Image const> frames, ResizeStrategy strategy)
		-> std::pair<ImageSize, ImageSize>;

/// Stretch an image to exactly the given size using a Lanczos filter.
/// Aspect ratio is not preserved.
[[nodiscard]] auto resample(Image const& src, ImageSize width, ImageSize height) -> Image;

/// Bring all frames to one size. Frames already at the target size are moved through untouched,
/// all others are resampled.
/// Requires at least two frames.
[[nodiscard]] auto unify_sizes(std::vector<Image> frames, ResizeStrategy strategy)
		-> UnifiedFrames;

} // namespace scanimate
