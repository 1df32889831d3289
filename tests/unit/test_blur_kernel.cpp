/**
 * @file test_blur_kernel.cpp
 * @brief Unit tests for the 9-tap separable blur kernel
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/config.h>
#include <glint/effects/blur_kernel.h>

using namespace glint;
using namespace glint::effects;
using Catch::Matchers::WithinAbs;

TEST_CASE("Blur weights", "[effects][blur]") {
    REQUIRE_THAT(blur::weightSum(), WithinAbs(1.0, 1e-5));

    SECTION("weights fall off from the center") {
        for (size_t i = 1; i < blur::WEIGHTS.size(); ++i) {
            REQUIRE(blur::WEIGHTS[i] < blur::WEIGHTS[i - 1]);
        }
    }
}

TEST_CASE("Blur on a uniform image", "[effects][blur]") {
    const glm::vec4 fill(0.2f, 0.4f, 0.6f, 1.0f);
    blur::Image image(16, 9, fill);

    blur::Image out = blur::convolve(image);
    REQUIRE(out.width == 16);
    REQUIRE(out.height == 9);
    for (const auto& px : out.pixels) {
        REQUIRE_THAT(px.r, WithinAbs(fill.r, 1e-5));
        REQUIRE_THAT(px.g, WithinAbs(fill.g, 1e-5));
        REQUIRE_THAT(px.b, WithinAbs(fill.b, 1e-5));
        REQUIRE_THAT(px.a, WithinAbs(fill.a, 1e-5));
    }
}

TEST_CASE("Blur spreads an impulse", "[effects][blur]") {
    blur::Image image(11, 11);
    image.at(5, 5) = glm::vec4(1.0f);

    SECTION("horizontal pass stays on the row") {
        blur::Image h = blur::convolvePass(image, blur::Direction::Horizontal);
        REQUIRE_THAT(h.at(5, 5).r, WithinAbs(blur::WEIGHTS[0], 1e-6));
        REQUIRE_THAT(h.at(3, 5).r, WithinAbs(blur::WEIGHTS[2], 1e-6));
        REQUIRE_THAT(h.at(7, 5).r, WithinAbs(blur::WEIGHTS[2], 1e-6));
        REQUIRE(h.at(5, 4).r == 0.0f);
        REQUIRE(h.at(0, 5).r == 0.0f);
    }

    SECTION("both passes conserve energy away from the edges") {
        blur::Image out = blur::convolve(image);
        float total = 0.0f;
        for (const auto& px : out.pixels) {
            total += px.r;
        }
        REQUIRE_THAT(total, WithinAbs(1.0, 1e-4));
        REQUIRE_THAT(out.at(5, 5).r, WithinAbs(blur::WEIGHTS[0] * blur::WEIGHTS[0], 1e-6));
        REQUIRE_THAT(out.at(4, 6).r, WithinAbs(out.at(6, 4).r, 1e-7));
    }
}

TEST_CASE("Blur rejects empty input", "[effects][blur]") {
    REQUIRE_THROWS_AS(blur::convolve(blur::Image()), ConfigError);

    blur::Image broken(4, 4);
    broken.pixels.pop_back();
    REQUIRE_THROWS_AS(blur::convolvePass(broken, blur::Direction::Vertical), ConfigError);
}
