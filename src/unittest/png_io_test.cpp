#include <catch2/catch.hpp>

#include <png++/png.hpp>

#include "png_io.hpp"
#include "test_util.hpp"

using namespace scanimate;
using namespace scanimate::test;


TEST_CASE("write_png / read_png: RGBA keeps transparency")
{
	TempDir dir;
	auto image = labelled_frames(1, 5, 3)[0];
	image(1, 1) = {9, 8, 7, 0};
	image(2, 2) = {200, 100, 50, 77};

	auto const path = dir.path() / "image.png";
	write_png(image, path, PixelFormat::rgba);

	CHECK(read_png(path) == image);
}

TEST_CASE("write_png: RGB drops alpha and keeps the stored color")
{
	TempDir dir;
	Image image{2, 1};
	image(0, 0) = {12, 34, 56, 0};
	image(1, 0) = {1, 2, 3, 255};

	auto const path = dir.path() / "opaque.png";
	write_png(image, path, PixelFormat::rgb);

	auto const back = read_png(path);
	CHECK(back(0, 0) == Color{12, 34, 56, 255});
	CHECK(back(1, 0) == Color{1, 2, 3, 255});
}

TEST_CASE("write_png: creates missing folders")
{
	TempDir dir;
	auto const path = dir.path() / "a" / "b" / "mask.png";
	write_png(Image{1, 1, colors::black}, path, PixelFormat::rgba);
	CHECK(std::filesystem::is_regular_file(path));
}

TEST_CASE("read_png: other pixel layouts become 8-bit RGBA")
{
	TempDir dir;
	auto const path = (dir.path() / "layout.png").string();

	SECTION("gray") {
		png::image<png::gray_pixel> png{2, 1};
		png[0][0] = 0;
		png[0][1] = 150;
		png.write(path);

		auto const image = read_png(path);
		CHECK(image(0, 0) == Color{0, 0, 0, 255});
		CHECK(image(1, 0) == Color{150, 150, 150, 255});
	}
	SECTION("gray with alpha") {
		png::image<png::ga_pixel> png{1, 1};
		png[0][0] = png::ga_pixel{60, 20};
		png.write(path);

		CHECK(read_png(path)(0, 0) == Color{60, 60, 60, 20});
	}
	SECTION("palette") {
		png::image<png::index_pixel> png{3, 1};
		png.set_palette({png::color{255, 0, 0}, png::color{0, 0, 255}, png::color{7, 8, 9}});
		png.set_tRNS({255, 128});
		png[0][0] = png::index_pixel{0};
		png[0][1] = png::index_pixel{1};
		png[0][2] = png::index_pixel{2};
		png.write(path);

		auto const image = read_png(path);
		CHECK(image(0, 0) == Color{255, 0, 0, 255});
		// Palette transparency becomes alpha, entries past the table stay opaque.
		CHECK(image(1, 0) == Color{0, 0, 255, 128});
		CHECK(image(2, 0) == Color{7, 8, 9, 255});
	}
	SECTION("16 bits per channel") {
		// Multiples of 257 map to the same 8-bit value whether rounded or truncated.
		png::image<png::rgba_pixel_16> png{2, 1};
		png[0][0] = png::rgba_pixel_16{0x1212, 0x3434, 0xfefe, 0xffff};
		png[0][1] = png::rgba_pixel_16{0x0000, 0xffff, 0x8080, 0x4040};
		png.write(path);

		auto const image = read_png(path);
		CHECK(image(0, 0) == Color{0x12, 0x34, 0xfe, 0xff});
		CHECK(image(1, 0) == Color{0x00, 0xff, 0x80, 0x40});
	}
}

TEST_CASE("png errors")
{
	TempDir dir;

	SECTION("missing input") {
		CHECK(thrown_kind([&] { (void)read_png(dir.path() / "missing.png"); })
		      == ErrorKind::frame_decode_failure);
	}
	SECTION("not a png") {
		auto const file = dir.touch("text.png", "hello");
		CHECK(thrown_kind([&] { (void)read_png(file); }) == ErrorKind::frame_decode_failure);
	}
	SECTION("unwritable output") {
		// A regular file cannot be used as a folder.
		auto const file = dir.touch("blocker");
		CHECK(thrown_kind([&] { write_png(Image{1, 1}, file / "out.png", PixelFormat::rgba); })
		      == ErrorKind::output_failure);
	}
}
