/**
 * @file test_quad_batch.cpp
 * @brief Unit tests for turning a snapshot into quad vertices
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/effects/quad_batch.h>
#include <glint/tween.h>

using namespace glint;
using namespace glint::effects;
using Catch::Matchers::WithinAbs;

namespace {

Drawable makeQuad(const std::string& id, glm::vec2 pos, glm::vec2 size) {
    Drawable d;
    d.id = id;
    d.position = pos;
    d.size = size;
    d.color = Color::Red;
    return d;
}

} // namespace

TEST_CASE("Quad vertices", "[effects][batch]") {
    QuadBatch batch;
    Drawable d = makeQuad("Btn", {100.0f, 100.0f}, {50.0f, 50.0f});
    d.effects = EffectFlags::Pulse | EffectFlags::Rainbow;
    batch.build({d});

    REQUIRE(batch.quadCount() == 1);
    REQUIRE(batch.vertices().size() == 4);
    REQUIRE(batch.indices() == std::vector<uint32_t>{0, 1, 2, 0, 2, 3});

    const auto& v = batch.vertices();
    REQUIRE(v[0].position == glm::vec2(100.0f, 100.0f));
    REQUIRE(v[1].position == glm::vec2(150.0f, 100.0f));
    REQUIRE(v[2].position == glm::vec2(150.0f, 150.0f));
    REQUIRE(v[3].position == glm::vec2(100.0f, 150.0f));
    REQUIRE(v[2].uv == glm::vec2(1.0f, 1.0f));

    for (const auto& vertex : v) {
        REQUIRE(vertex.color == glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        REQUIRE(vertex.effectFlags == 5u);
    }

    SECTION("rebuild replaces the previous contents") {
        batch.build({});
        REQUIRE(batch.empty());
        REQUIRE(batch.indices().empty());
    }
}

TEST_CASE("Scale is applied about the center", "[effects][batch]") {
    QuadBatch batch;
    Drawable d = makeQuad("Btn", {100.0f, 100.0f}, {50.0f, 50.0f});
    d.scale = 2.0f;
    batch.build({d});

    REQUIRE(batch.vertices()[0].position == glm::vec2(75.0f, 75.0f));
    REQUIRE(batch.vertices()[2].position == glm::vec2(175.0f, 175.0f));
}

TEST_CASE("Quads are skipped for text and empty drawables", "[effects][batch]") {
    Drawable text = makeQuad("output-1", {0.0f, 0.0f}, {300.0f, 24.0f});
    text.kind = DrawableKind::Text;
    Drawable empty = makeQuad("empty", {0.0f, 0.0f}, {0.0f, 10.0f});
    Drawable card = makeQuad("card", {0.0f, 0.0f}, {300.0f, 60.0f});
    card.kind = DrawableKind::Card;

    REQUIRE_FALSE(QuadBatch::producesQuad(text));
    REQUIRE_FALSE(QuadBatch::producesQuad(empty));
    REQUIRE(QuadBatch::producesQuad(card));

    QuadBatch batch;
    batch.build({text, empty, card});
    REQUIRE(batch.quadCount() == 1);
}

TEST_CASE("Shadows", "[effects][batch]") {
    QuadBatch batch;
    Drawable d = makeQuad("Btn", {100.0f, 100.0f}, {50.0f, 50.0f});
    d.effects = EffectFlags::Shake | EffectFlags::Pulse;

    SECTION("shallow shadow adds one layer behind the quad") {
        d.shadow = 8.0f;
        batch.build({d});
        REQUIRE(batch.quadCount() == 2);

        const QuadVertex& shadow = batch.vertices()[0];
        REQUIRE(shadow.position == glm::vec2(104.0f, 104.0f));
        REQUIRE_THAT(shadow.color.a, WithinAbs(SHADOW_ALPHA, 1e-6));
        REQUIRE(shadow.color.r == 0.0f);
        // Only shake carries over to the shadow
        REQUIRE(shadow.effectFlags == 2u);

        REQUIRE(batch.vertices()[4].position == glm::vec2(100.0f, 100.0f));
        REQUIRE(batch.indices()[6] == 4u);
    }

    SECTION("deep shadow adds a wider layer first") {
        d.shadow = 20.0f;
        REQUIRE(d.shadow > DEEP_SHADOW_DEPTH);
        batch.build({d});
        REQUIRE(batch.quadCount() == 3);

        REQUIRE(batch.vertices()[0].position == glm::vec2(112.0f, 112.0f));
        REQUIRE_THAT(batch.vertices()[0].color.a, WithinAbs(DEEP_SHADOW_ALPHA, 1e-6));
        REQUIRE(batch.vertices()[4].position == glm::vec2(110.0f, 110.0f));
        REQUIRE_THAT(batch.vertices()[4].color.a, WithinAbs(SHADOW_ALPHA, 1e-6));
    }
}

TEST_CASE("Draw ranges follow image changes", "[effects][batch]") {
    QuadBatch batch;
    Drawable plainA = makeQuad("a", {0.0f, 0.0f}, {10.0f, 10.0f});
    Drawable plainB = makeQuad("b", {20.0f, 0.0f}, {10.0f, 10.0f});
    Drawable logo = makeQuad("logo", {40.0f, 0.0f}, {10.0f, 10.0f});
    logo.image = "logo.png";
    Drawable logoShadowed = logo;
    logoShadowed.id = "logo2";
    logoShadowed.shadow = 4.0f;

    SECTION("plain quads share one range") {
        batch.build({plainA, plainB});
        REQUIRE(batch.ranges().size() == 1);
        REQUIRE(batch.ranges()[0].image.empty());
        REQUIRE(batch.ranges()[0].firstIndex == 0);
        REQUIRE(batch.ranges()[0].indexCount == 12);
    }

    SECTION("an image splits the range and shadows stay untextured") {
        batch.build({plainA, logo, logoShadowed, plainB});
        const auto& r = batch.ranges();
        REQUIRE(r.size() == 5);
        REQUIRE(r[0].image.empty());
        REQUIRE(r[1].image == "logo.png");
        REQUIRE(r[1].firstIndex == 6);
        REQUIRE(r[1].indexCount == 6);
        REQUIRE(r[2].image.empty());   // logo2's shadow
        REQUIRE(r[3].image == "logo.png");
        REQUIRE(r[4].image.empty());
        REQUIRE(r[4].firstIndex + r[4].indexCount == batch.indices().size());
    }

    SECTION("ranges are cleared with the batch") {
        batch.build({logo});
        batch.clear();
        REQUIRE(batch.ranges().empty());
    }
}
