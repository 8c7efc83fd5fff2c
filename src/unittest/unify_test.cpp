#include <catch2/catch.hpp>

#include "unify.hpp"
#include "test_util.hpp"

using namespace scanimate;
using namespace scanimate::test;


static auto is_solid(Image const& image, Color const& color) -> bool
{
	for (auto const& pixel : image.pixels()) {
		if (pixel != color) return false;
	}
	return true;
}

TEST_CASE("target_size")
{
	std::vector<Image> frames{Image{5, 9}, Image{8, 3}, Image{6, 6}};

	SECTION("first") {
		CHECK(target_size(frames, ResizeStrategy::first) == std::pair<ImageSize, ImageSize>{5, 9});
	}
	SECTION("min takes each axis independently") {
		// No single frame is 5x3.
		CHECK(target_size(frames, ResizeStrategy::min) == std::pair<ImageSize, ImageSize>{5, 3});
	}
	SECTION("empty") {
		CHECK(thrown_kind([] { (void)target_size({}, ResizeStrategy::first); })
		      == ErrorKind::insufficient_frames);
	}
}

TEST_CASE("unify_sizes: first")
{
	auto frames = labelled_frames(1, 4, 3);
	frames.emplace_back(6, 2, green);
	frames.emplace_back(4, 3, blue);
	auto const original = frames[0];

	auto const unified = unify_sizes(std::move(frames), ResizeStrategy::first);

	CHECK(unified.width == 4);
	CHECK(unified.height == 3);
	REQUIRE(unified.frames.size() == 3);
	for (auto const& frame : unified.frames) {
		CHECK(frame.width() == 4);
		CHECK(frame.height() == 3);
	}
	// Matching frames are passed through untouched.
	CHECK(unified.frames[0] == original);
	CHECK(is_solid(unified.frames[1], green));
	CHECK(is_solid(unified.frames[2], blue));

	// Only the frame of a different size is reported, with its original size.
	REQUIRE(unified.resampled.size() == 1);
	CHECK(unified.resampled[0] == Resampled{1, 6, 2});
}

TEST_CASE("unify_sizes: min")
{
	std::vector<Image> frames{Image{7, 2, red}, Image{3, 9, green}, Image{5, 5, blue}};
	auto const unified = unify_sizes(std::move(frames), ResizeStrategy::min);

	CHECK(unified.width == 3);
	CHECK(unified.height == 2);
	for (auto const& frame : unified.frames) {
		CHECK(frame.width() == 3);
		CHECK(frame.height() == 2);
	}
	CHECK(is_solid(unified.frames[0], red));
	CHECK(is_solid(unified.frames[1], green));
	CHECK(is_solid(unified.frames[2], blue));

	// Every frame differs from the 3x2 target.
	REQUIRE(unified.resampled.size() == 3);
	CHECK(unified.resampled[0] == Resampled{0, 7, 2});
	CHECK(unified.resampled[1] == Resampled{1, 3, 9});
	CHECK(unified.resampled[2] == Resampled{2, 5, 5});
}

TEST_CASE("unify_sizes: equal sizes need no resampling")
{
	auto const unified = unify_sizes(labelled_frames(3, 4, 4), ResizeStrategy::min);
	CHECK(unified.resampled.empty());
}

TEST_CASE("unify_sizes: errors")
{
	CHECK(thrown_kind([] { (void)unify_sizes({}, ResizeStrategy::first); })
	      == ErrorKind::insufficient_frames);
	CHECK(thrown_kind([] { (void)unify_sizes({Image{2, 2}}, ResizeStrategy::first); })
	      == ErrorKind::insufficient_frames);
	CHECK(thrown_kind([] {
		std::vector<Image> frames{Image{2, 2}, Image{}};
		(void)unify_sizes(std::move(frames), ResizeStrategy::min);
	}) == ErrorKind::invalid_geometry);
}

TEST_CASE("resample")
{
	SECTION("solid colors stay solid") {
		Color const color{10, 200, 30, 255};
		CHECK(is_solid(resample(Image{4, 4, color}, 7, 3), color));
		CHECK(is_solid(resample(Image{9, 2, color}, 2, 5), color));
	}
	SECTION("transparent stays transparent") {
		CHECK(is_solid(resample(Image{5, 5}, 3, 8), colors::transparent));
	}
	SECTION("translucent color is not darkened by premultiplication") {
		Color const color{200, 100, 50, 128};
		auto const out = resample(Image{3, 3, color}, 6, 6);
		for (auto const& pixel : out.pixels()) {
			CHECK(pixel[3] == 128);
			CHECK(int(pixel[0]) == Approx(200).margin(1));
			CHECK(int(pixel[1]) == Approx(100).margin(1));
			CHECK(int(pixel[2]) == Approx(50).margin(1));
		}
	}
	SECTION("same size is identity for opaque images") {
		auto const frame = labelled_frames(3, 6, 4)[2];
		CHECK(resample(frame, 6, 4) == frame);
	}
	SECTION("stretches to the exact size") {
		auto const out = resample(Image{10, 10, red}, 1, 17);
		CHECK(out.width() == 1);
		CHECK(out.height() == 17);
	}
	SECTION("downsampling averages") {
		// Alternating black and white columns average to mid gray.
		Image stripes{64, 1};
		for (ImageSize x = 0; x < 64; ++x) {
			stripes(x, 0) = (x % 2) ? colors::white : colors::black;
		}
		auto const out = resample(stripes, 8, 1);
		// Away from the edges, where the kernel is cut off.
		for (ImageSize x = 2; x < 6; ++x) {
			CHECK(int(out(x, 0)[0]) == Approx(128).margin(4));
		}
	}
	SECTION("invalid sizes") {
		CHECK(thrown_kind([] { (void)resample(Image{2, 2}, 0, 2); }) == ErrorKind::invalid_geometry);
		CHECK(thrown_kind([] { (void)resample(Image{}, 2, 2); }) == ErrorKind::invalid_geometry);
	}
}
