/**
 * @file test_tween.cpp
 * @brief Unit tests for easing, per-property interpolation and tween timing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/drawable.h>
#include <glint/tween.h>

using namespace glint;
using Catch::Matchers::WithinAbs;

TEST_CASE("Property and easing names", "[tween]") {
    REQUIRE(parseProperty("color") == TweenProperty::Color);
    REQUIRE(parseProperty("Color") == TweenProperty::Color);
    REQUIRE(parseProperty("色") == TweenProperty::Color);
    REQUIRE(parseProperty("size") == TweenProperty::Scale);
    REQUIRE(parseProperty("影") == TweenProperty::Shadow);
    REQUIRE_FALSE(parseProperty("opacity").has_value());

    REQUIRE(parseEasing("linear") == Easing::Linear);
    REQUIRE(parseEasing("ease-in-out") == Easing::EaseInOut);
    REQUIRE(parseEasing("elastic") == Easing::Elastic);
    REQUIRE_FALSE(parseEasing("bounce").has_value());
}

TEST_CASE("Easing curves", "[tween]") {
    for (Easing e : {Easing::Linear, Easing::EaseInOut, Easing::Elastic}) {
        REQUIRE_THAT(applyEasing(e, 0.0f), WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(applyEasing(e, 1.0f), WithinAbs(1.0, 1e-6));
    }

    REQUIRE_THAT(applyEasing(Easing::Linear, 0.25f), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(applyEasing(Easing::EaseInOut, 0.5f), WithinAbs(0.5, 1e-6));
    REQUIRE(applyEasing(Easing::EaseInOut, 0.25f) < 0.25f);

    // Elastic overshoots early on
    REQUIRE(applyEasing(Easing::Elastic, 0.1f) > 1.0f);
}

TEST_CASE("Per-property interpolation", "[tween]") {
    SECTION("scale is linear") {
        auto v = interpolate(ScaleValue{1.0f}, ScaleValue{2.0f}, 0.5f, Easing::Linear);
        REQUIRE_THAT(std::get<ScaleValue>(v).value, WithinAbs(1.5, 1e-6));
    }

    SECTION("scale may overshoot with elastic") {
        auto v = interpolate(ScaleValue{1.0f}, ScaleValue{2.0f}, 0.1f, Easing::Elastic);
        REQUIRE(std::get<ScaleValue>(v).value > 2.0f);
    }

    SECTION("color channels are clamped when the easing overshoots") {
        auto v = interpolate(ColorValue{Color::Black}, ColorValue{Color::White}, 0.1f, Easing::Elastic);
        Color c = std::get<ColorValue>(v).value;
        REQUIRE(c.r <= 1.0f);
        REQUIRE(c.g <= 1.0f);
        REQUIRE(c.b <= 1.0f);
        REQUIRE_THAT(c.r, WithinAbs(1.0, 1e-6));
    }

    SECTION("shadow snaps at half progress") {
        auto before = interpolate(ShadowValue{0.0f}, ShadowValue{20.0f}, 0.49f, Easing::Linear);
        auto after = interpolate(ShadowValue{0.0f}, ShadowValue{20.0f}, 0.5f, Easing::Linear);
        REQUIRE(std::get<ShadowValue>(before).depth == 0.0f);
        REQUIRE(std::get<ShadowValue>(after).depth == 20.0f);
    }
}

TEST_CASE("Tween timing", "[tween]") {
    Tween tween("Btn", ColorValue{Color::Red}, ColorValue{Color::Blue}, 0.1f, 2.0);

    REQUIRE(tween.property() == TweenProperty::Color);
    REQUIRE(tween.progress(1.0) == 0.0f);
    REQUIRE_THAT(tween.progress(2.05), WithinAbs(0.5, 1e-4));
    REQUIRE_FALSE(tween.finished(2.05));

    SECTION("completes once elapsed reaches the duration") {
        REQUIRE(tween.finished(2.1));
        REQUIRE(std::get<ColorValue>(tween.sample(2.1)).value == Color::Blue);
        REQUIRE(std::get<ColorValue>(tween.sample(5.0)).value == Color::Blue);
    }

    SECTION("zero duration is complete immediately") {
        Tween snap("Btn", ScaleValue{1.0f}, ScaleValue{3.0f}, 0.0f, 2.0);
        REQUIRE(snap.finished(2.0));
        REQUIRE(std::get<ScaleValue>(snap.sample(2.0)).value == 3.0f);
    }

    SECTION("negative duration is treated as zero") {
        Tween snap("Btn", ScaleValue{1.0f}, ScaleValue{3.0f}, -1.0f, 0.0);
        REQUIRE(snap.duration() == 0.0f);
        REQUIRE(snap.finished(0.0));
    }
}

TEST_CASE("Property read/write", "[tween]") {
    Drawable d;
    d.color = Color::Red;
    d.scale = 1.25f;
    d.shadow = 4.0f;

    REQUIRE(std::get<ColorValue>(readProperty(d, TweenProperty::Color)).value == Color::Red);
    REQUIRE(std::get<ScaleValue>(readProperty(d, TweenProperty::Scale)).value == 1.25f);
    REQUIRE(std::get<ShadowValue>(readProperty(d, TweenProperty::Shadow)).depth == 4.0f);

    writeProperty(d, ShadowValue{12.0f});
    writeProperty(d, ColorValue{Color::Green});
    REQUIRE(d.shadow == 12.0f);
    REQUIRE(d.color == Color::Green);
    REQUIRE(d.scale == 1.25f);
}
