#include "unify.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>


namespace scanimate {

auto to_string(ResizeStrategy const strategy) noexcept -> std::string_view {
	switch (strategy) {
		case ResizeStrategy::first: return "first";
		case ResizeStrategy::min:   return "min";
		}

	return "unknown";
	}


namespace {

/// Half width of the Lanczos kernel at unit scale.
constexpr double lanczos_lobes {3.0};

/// A premultiplied color with floating point channels in the range [0, 255].
using Sample = std::array<float, 4>;

/// An intermediate floating point image.
struct Plane {
	ImageSize           width  {0};
	ImageSize           height {0};
	std::vector<Sample> samples {};

	[[nodiscard]] auto at(ImageSize const x, ImageSize const y) noexcept -> Sample& {
		return samples[std::size_t{y} * width + x];
		}

	[[nodiscard]] auto at(ImageSize const x, ImageSize const y) const noexcept -> Sample const& {
		return samples[std::size_t{y} * width + x];
		}

	};

/// The input samples contributing to one output sample.
struct Contribution {
	ImageSize          first   {0};
	std::vector<float> weights {};
	};


[[nodiscard]] auto sinc(double x) noexcept -> double {
	if (x == 0.0) {
		return 1.0;
		}

	x *= std::numbers::pi;
	return std::sin(x) / x;
	}

[[nodiscard]] auto lanczos(double const x) noexcept -> double {
	if (std::abs(x) >= lanczos_lobes) {
		return 0.0;
		}

	return sinc(x) * sinc(x / lanczos_lobes);
	}

/// Compute the filter taps mapping an axis of `in_size` samples onto `out_size` samples.
/// When downsampling, the kernel is widened by the scale factor.
[[nodiscard]] auto contributions(ImageSize const in_size, ImageSize const out_size)
		-> std::vector<Contribution> {
	auto const scale        {static_cast<double>(in_size) / out_size};
	auto const filter_scale {std::max(scale, 1.0)};
	auto const support      {lanczos_lobes * filter_scale};

	std::vector<Contribution> result (out_size);

	for (ImageSize i {0}; i < out_size; ++i) {
		auto const center {(i + 0.5) * scale};
		auto const first  {static_cast<ImageSize>(std::max(0.0, std::floor(center - support)))};
		auto const last   {static_cast<ImageSize>(
				std::min<double>(in_size, std::ceil(center + support)))};

		auto& contrib {result[i]};
		contrib.first = first;
		contrib.weights.reserve(last - first);

		double sum {0.0};

		for (auto j {first}; j < last; ++j) {
			auto const weight {lanczos((j + 0.5 - center) / filter_scale)};
			contrib.weights.push_back(static_cast<float>(weight));
			sum += weight;
			}

		// Normalize so flat regions keep their value.
		if (sum != 0.0) {
			for (auto& weight : contrib.weights) {
				weight = static_cast<float>(weight / sum);
				}}}

	return result;
	}

/// Accumulate weighted samples, reading input sample `k` through `sample(k)`.
template<typename Fn>
[[nodiscard]] auto convolve(Contribution const& contrib, Fn&& sample) noexcept -> Sample {
	Sample out {0, 0, 0, 0};

	for (std::size_t k {0}; k < contrib.weights.size(); ++k) {
		auto const& in {sample(contrib.first + static_cast<ImageSize>(k))};

		for (std::size_t c {0}; c < out.size(); ++c) {
			out[c] += contrib.weights[k] * in[c];
			}}

	return out;
	}

[[nodiscard]] auto resample_width(Plane const& in, ImageSize const out_width) -> Plane {
	auto const taps {contributions(in.width, out_width)};

	Plane out {out_width, in.height, std::vector<Sample>(std::size_t{out_width} * in.height)};

	for (ImageSize y {0}; y < in.height; ++y) {
		for (ImageSize x {0}; x < out_width; ++x) {
			out.at(x, y) = convolve(taps[x], [&](ImageSize const k) -> Sample const& {
					return in.at(k, y);
					});
			}}

	return out;
	}

[[nodiscard]] auto resample_height(Plane const& in, ImageSize const out_height) -> Plane {
	auto const taps {contributions(in.height, out_height)};

	Plane out {in.width, out_height, std::vector<Sample>(std::size_t{in.width} * out_height)};

	for (ImageSize y {0}; y < out_height; ++y) {
		for (ImageSize x {0}; x < in.width; ++x) {
			out.at(x, y) = convolve(taps[y], [&](ImageSize const k) -> Sample const& {
					return in.at(x, k);
					});
			}}

	return out;
	}

[[nodiscard]] auto to_channel(float const value) noexcept -> color::Channel {
	return static_cast<color::Channel>(std::clamp(
			std::lround(value),
			0l,
			static_cast<long>(color::channel_max)
			));
	}

/// Convert an image to premultiplied floating point samples.
[[nodiscard]] auto premultiply(Image const& src) -> Plane {
	Plane out {src.width(), src.height(), std::vector<Sample>(src.num_pixels())};

	auto const in {src.pixels()};

	std::transform(in.begin(), in.end(), out.samples.begin(), [](Color const& color) {
			auto const alpha {static_cast<float>(color[color::alpha_channel])};
			auto const scale {alpha / color::channel_max};
			return Sample{color[0] * scale, color[1] * scale, color[2] * scale, alpha};
			});

	return out;
	}

/// Convert premultiplied samples back to an 8-bit image.
[[nodiscard]] auto unpremultiply(Plane const& src) -> Image {
	Image out {src.width, src.height};

	std::transform(src.samples.begin(), src.samples.end(), out.pixels().begin(),
			[](Sample const& sample) -> Color {
				auto const alpha {
						std::min(sample[color::alpha_channel], float{color::channel_max})};

				// Ringing can push alpha below zero.
				if (alpha <= 0.0f) {
					return colors::transparent;
					}

				auto const scale {color::channel_max / alpha};
				return {
						to_channel(sample[0] * scale),
						to_channel(sample[1] * scale),
						to_channel(sample[2] * scale),
						to_channel(alpha),
						};
				});

	return out;
	}

} // namespace


auto target_size(std::span<Image const> const frames, ResizeStrategy const strategy)
		-> std::pair<ImageSize, ImageSize> {
	if (frames.empty()) {
		throw Error{ErrorKind::insufficient_frames, "No frames to unify"};
		}

	switch (strategy) {
		case ResizeStrategy::first:
			return {frames.front().width(), frames.front().height()};

		case ResizeStrategy::min: {
			auto const by_width  {[](Image const& lhs, Image const& rhs) {
				return lhs.width() < rhs.width();
				}};
			auto const by_height {[](Image const& lhs, Image const& rhs) {
				return lhs.height() < rhs.height();
				}};

			return {
					std::min_element(frames.begin(), frames.end(), by_width)->width(),
					std::min_element(frames.begin(), frames.end(), by_height)->height(),
					};
			}}

	throw Error{ErrorKind::invalid_argument, "Unknown resize strategy"};
	}

auto resample(Image const& src, ImageSize const width, ImageSize const height) -> Image {
	if (src.empty() or width == 0 or height == 0) {
		throw Error{ErrorKind::invalid_geometry, concat(
				"Cannot resample a ", src.width(), "x", src.height(), " image to ",
				width, "x", height)};
		}

	auto plane {premultiply(src)};

	if (plane.width != width) {
		plane = resample_width(plane, width);
		}

	if (plane.height != height) {
		plane = resample_height(plane, height);
		}

	return unpremultiply(plane);
	}

auto unify_sizes(std::vector<Image> frames, ResizeStrategy const strategy) -> UnifiedFrames {
	if (frames.size() < 2) {
		throw Error{ErrorKind::insufficient_frames, concat(
				"At least 2 frames are required, got ", frames.size())};
		}

	for (std::size_t i {0}; i < frames.size(); ++i) {
		if (frames[i].empty()) {
			throw Error{ErrorKind::invalid_geometry, concat(
					"Frame #", i, " has no pixels (", frames[i].width(), "x", frames[i].height(), ")")};
			}}

	auto const [width, height] {target_size(frames, strategy)};

	std::vector<Resampled> resampled;

	for (std::size_t i {0}; i < frames.size(); ++i) {
		auto& frame {frames[i]};

		if (frame.width() != width or frame.height() != height) {
			resampled.push_back({i, frame.width(), frame.height()});
			frame = resample(frame, width, height);
			}}

	return {std::move(frames), width, height, std::move(resampled)};
	}

} // namespace scanimate
