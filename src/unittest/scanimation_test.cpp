#include <catch2/catch.hpp>

#include "mask.hpp"
#include "scanimation.hpp"
#include "test_util.hpp"

using namespace scanimate;
using namespace scanimate::test;


TEST_CASE("build: three solid frames, one pixel slices")
{
	std::vector<Image> frames{Image{4, 2, red}, Image{4, 2, green}, Image{4, 2, blue}};
	auto const result = build(std::move(frames), {});

	CHECK(result.geometry == Geometry{4, 2, 1, 3, Direction::vertical});
	for (ImageSize y = 0; y < 2; ++y) {
		CHECK(result.base(0, y) == red);
		CHECK(result.base(1, y) == green);
		CHECK(result.base(2, y) == blue);
		CHECK(result.base(3, y) == red);
	}
}

TEST_CASE("build: frames of different sizes are unified first")
{
	std::vector<Image> frames{Image{6, 4, red}, Image{3, 8, green}};
	Settings settings;
	settings.slice = 2;
	settings.resize = ResizeStrategy::min;

	auto const result = build(std::move(frames), settings);

	REQUIRE(result.base.width() == 3);
	REQUIRE(result.base.height() == 4);
	for (ImageSize y = 0; y < 4; ++y) {
		CHECK(result.base(0, y) == red);
		CHECK(result.base(1, y) == red);
		CHECK(result.base(2, y) == green);
	}
}

TEST_CASE("build: post-pass")
{
	std::vector<Image> frames{Image{2, 2}, Image{2, 2, {10, 20, 30, 0}}};
	Settings settings;

	SECTION("white background") {
		settings.flatten = Flatten::white_background;
		auto const result = build(frames, settings);
		CHECK(result.base == Image{2, 2, colors::white});
	}
	SECTION("drop alpha") {
		settings.flatten = Flatten::drop_alpha;
		auto const result = build(frames, settings);
		CHECK(result.base(0, 0) == colors::black);
		CHECK(result.base(1, 0) == Color{10, 20, 30, 255});
	}
	SECTION("none") {
		auto const result = build(frames, settings);
		CHECK(result.base(1, 1) == Color{10, 20, 30, 0});
	}
}

TEST_CASE("build: fewer than two frames")
{
	CHECK(thrown_kind([] { (void)build({Image{2, 2}}, {}); }) == ErrorKind::insufficient_frames);
}

TEST_CASE("sliding the mask by one stripe reveals the next frame")
{
	for (auto const direction : {Direction::vertical, Direction::horizontal}) {
		for (ImageSize slice = 1; slice <= 3; ++slice) {
			std::size_t const n = 4;
			auto const frames = labelled_frames(n, 29, 29);

			Settings settings;
			settings.slice = slice;
			settings.direction = direction;
			auto const result = build(frames, settings);
			auto const mask = make_mask(result.geometry);

			for (std::size_t shift = 0; shift < n; ++shift) {
				auto const offset = static_cast<ImageSize>(shift * slice);

				// A pixel of the base shows through where the shifted mask is transparent.
				for (ImageSize y = 0; y < 29; ++y) {
					for (ImageSize x = 0; x < 29; ++x) {
						auto const pos = direction == Direction::vertical ? x : y;
						if (pos < offset) continue;

						auto const mx = direction == Direction::vertical ? x - offset : x;
						auto const my = direction == Direction::vertical ? y : y - offset;
						if (mask(mx, my) != colors::transparent) continue;

						REQUIRE(result.base(x, y) == frames[shift](x, y));
					}
				}
			}
		}
	}
}
