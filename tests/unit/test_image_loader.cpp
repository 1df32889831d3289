/**
 * @file test_image_loader.cpp
 * @brief Unit tests for decoding card images to RGBA
 */

#include <catch2/catch_test_macros.hpp>
#include <glint/io/image_loader.h>
#include <array>
#include <string>

using namespace glint::io;

namespace {

std::string fixture(const std::string& name) {
    return std::string(GLINT_TEST_FIXTURES) + "/images/" + name;
}

// RGBA of pixel (x, y), top row first
std::array<int, 4> pixelAt(const ImageData& image, int x, int y) {
    size_t i = (static_cast<size_t>(y) * image.width + x) * 4;
    return {image.pixels[i], image.pixels[i + 1], image.pixels[i + 2], image.pixels[i + 3]};
}

} // namespace

TEST_CASE("Image loading", "[image]") {
    SECTION("bitmap decodes to RGBA, top row first") {
        ImageData image = loadImage(fixture("quadrants.bmp"));
        REQUIRE(image.valid());
        REQUIRE(image.width == 2);
        REQUIRE(image.height == 2);
        REQUIRE(image.channels == 3);
        REQUIRE(image.pixels.size() == 16);

        REQUIRE(pixelAt(image, 0, 0) == std::array<int, 4>{255, 0, 0, 255});
        REQUIRE(pixelAt(image, 1, 0) == std::array<int, 4>{0, 255, 0, 255});
        REQUIRE(pixelAt(image, 0, 1) == std::array<int, 4>{0, 0, 255, 255});
        REQUIRE(pixelAt(image, 1, 1) == std::array<int, 4>{255, 255, 255, 255});
    }

    SECTION("missing file") {
        REQUIRE_FALSE(fileExists(fixture("nope.png")));
        ImageData image = loadImage(fixture("nope.png"));
        REQUIRE_FALSE(image.valid());
        REQUIRE(image.pixels.empty());
    }

    SECTION("directory is not an image") {
        REQUIRE_FALSE(fileExists(std::string(GLINT_TEST_FIXTURES) + "/images"));
        REQUIRE_FALSE(loadImage(std::string(GLINT_TEST_FIXTURES) + "/images").valid());
    }

    SECTION("undecodable file") {
        REQUIRE(fileExists(fixture("not_an_image.png")));
        REQUIRE_FALSE(loadImage(fixture("not_an_image.png")).valid());
    }
}
