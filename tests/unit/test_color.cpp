/**
 * @file test_color.cpp
 * @brief Unit tests for color word and hex parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/color.h>

using namespace glint;
using Catch::Matchers::WithinAbs;

TEST_CASE("Color names", "[color]") {
    SECTION("basic names resolve") {
        REQUIRE(Color::fromName("red") == Color::Red);
        REQUIRE(Color::fromName("blue") == Color::Blue);
        REQUIRE(Color::fromName("transparent") == Color::Transparent);
    }

    SECTION("blue is pure opaque blue") {
        Color blue = *Color::fromName("blue");
        REQUIRE(blue.r == 0.0f);
        REQUIRE(blue.g == 0.0f);
        REQUIRE(blue.b == 1.0f);
        REQUIRE(blue.a == 1.0f);
    }

    SECTION("matching ignores ASCII case") {
        REQUIRE(Color::fromName("RED") == Color::Red);
        REQUIRE(Color::fromName("Grey") == Color::Gray);
    }

    SECTION("runtime color words") {
        REQUIRE(Color::fromName("青") == Color::Blue);
        REQUIRE(Color::fromName("赤") == Color::Red);
        REQUIRE(Color::fromName("黄色") == Color::Yellow);
    }

    SECTION("unknown names are rejected") {
        REQUIRE_FALSE(Color::fromName("notacolor").has_value());
        REQUIRE_FALSE(Color::fromName("").has_value());
    }
}

TEST_CASE("Color hex strings", "[color]") {
    SECTION("#RRGGBB is opaque") {
        auto c = Color::fromHex(std::string("#00ff00"));
        REQUIRE(c.has_value());
        REQUIRE(c->r == 0.0f);
        REQUIRE(c->g == 1.0f);
        REQUIRE(c->b == 0.0f);
        REQUIRE(c->a == 1.0f);
    }

    SECTION("#RRGGBBAA keeps alpha, even with a zero red channel") {
        auto c = Color::fromHex(std::string("#0000ff80"));
        REQUIRE(c.has_value());
        REQUIRE(c->r == 0.0f);
        REQUIRE(c->b == 1.0f);
        REQUIRE_THAT(c->a, WithinAbs(128.0 / 255.0, 1e-6));
    }

    SECTION("leading # is optional and names fall back to hex") {
        REQUIRE(Color::fromName("ff0000") == Color::Red);
    }

    SECTION("malformed hex") {
        REQUIRE_FALSE(Color::fromHex(std::string("#12345")).has_value());
        REQUIRE_FALSE(Color::fromHex(std::string("#gg0000")).has_value());
    }

    SECTION("packed values") {
        REQUIRE(Color::fromHex(0xFF0000u) == Color::Red);
        Color withAlpha = Color::fromHex(0x00FF00FFu);
        REQUIRE(withAlpha.g == 1.0f);
        REQUIRE(withAlpha.a == 1.0f);
    }
}

TEST_CASE("Color lerp", "[color]") {
    Color mid = Color::Black.lerp(Color::White, 0.5f);
    REQUIRE_THAT(mid.r, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(mid.g, WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(mid.b, WithinAbs(0.5, 1e-6));
    REQUIRE(mid.a == 1.0f);
}
