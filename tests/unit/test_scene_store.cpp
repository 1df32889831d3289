/**
 * @file test_scene_store.cpp
 * @brief Unit tests for drawable storage, tween scheduling and handler bindings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/scene_store.h>

using namespace glint;
using Catch::Matchers::WithinAbs;

namespace {

DrawEvent quad(const std::string& id, glm::vec2 pos, glm::vec2 size, Color color = Color::Red) {
    DrawEvent e;
    e.drawable.id = id;
    e.drawable.position = pos;
    e.drawable.size = size;
    e.drawable.color = color;
    return e;
}

DrawEvent autoCard(const std::string& id) {
    DrawEvent e;
    e.drawable.id = id;
    e.drawable.kind = DrawableKind::Card;
    e.drawable.size = StackLayout::defaultSize(DrawableKind::Card);
    e.drawable.autoLayout = true;
    return e;
}

AnimateEvent animate(const std::string& id, PropertyValue value, float duration,
                     Easing easing = Easing::Linear) {
    AnimateEvent e;
    e.targetId = id;
    e.value = value;
    e.duration = duration;
    e.easing = easing;
    return e;
}

} // namespace

TEST_CASE("Draw events", "[store]") {
    SceneStore store;
    store.apply(quad("A", {10, 10}, {20, 20}));
    store.apply(quad("B", {50, 50}, {20, 20}, Color::Green));

    REQUIRE(store.drawableCount() == 2);

    SECTION("same id updates in place and keeps draw order") {
        store.apply(quad("A", {15, 15}, {30, 30}, Color::Blue));
        REQUIRE(store.drawableCount() == 2);

        auto snapshot = store.snapshot();
        REQUIRE(snapshot[0].id == "A");
        REQUIRE(snapshot[0].position == glm::vec2(15, 15));
        REQUIRE(snapshot[0].color == Color::Blue);
        REQUIRE(snapshot[1].id == "B");
    }

    SECTION("redraw keeps animated scale, shadow and color") {
        store.apply(animate("A", ScaleValue{2.0f}, 0.0f));
        store.apply(animate("A", ShadowValue{8.0f}, 0.0f));
        store.apply(animate("A", ColorValue{Color::Blue}, 0.0f));
        store.advance(0.0);
        REQUIRE(store.activeTweenCount() == 0);

        store.apply(quad("A", {12, 12}, {20, 20}, Color::Red));

        const Drawable* a = store.find("A");
        REQUIRE(a->scale == 2.0f);
        REQUIRE(a->shadow == 8.0f);
        REQUIRE(a->color == Color::Blue);
        REQUIRE(a->position == glm::vec2(12, 12));

        // Drawables that were never animated still take the redrawn color
        store.apply(quad("B", {50, 50}, {20, 20}, Color::Yellow));
        REQUIRE(store.find("B")->color == Color::Yellow);
    }

    SECTION("redraw during a tween keeps the animated value") {
        store.apply(animate("A", ScaleValue{3.0f}, 1.0f));
        store.advance(0.5);
        store.apply(quad("A", {10, 10}, {20, 20}));
        REQUIRE_THAT(store.find("A")->scale, WithinAbs(2.0, 1e-5));

        store.advance(0.5);
        REQUIRE(store.find("A")->scale == 3.0f);
    }

    SECTION("reset forgets animated values") {
        store.apply(animate("A", ColorValue{Color::Blue}, 0.0f));
        store.advance(0.0);
        store.reset();
        store.apply(quad("A", {10, 10}, {20, 20}, Color::Red));
        REQUIRE(store.find("A")->color == Color::Red);
    }

    SECTION("unknown effect bits are dropped") {
        DrawEvent e = quad("C", {0, 0}, {5, 5});
        e.drawable.effects = static_cast<EffectFlags>(0xFFu);
        store.apply(e);
        REQUIRE(static_cast<uint32_t>(store.find("C")->effects) == EFFECT_FLAGS_MASK);
    }

    SECTION("drawables without an id are ignored") {
        store.apply(quad("", {0, 0}, {5, 5}));
        REQUIRE(store.drawableCount() == 2);
    }

    SECTION("unparsed events change nothing") {
        store.apply(UnparsedEvent{"runtime> hello"});
        REQUIRE(store.drawableCount() == 2);
    }
}

TEST_CASE("Stack layout placement", "[store][layout]") {
    SceneStore store;
    store.apply(autoCard("first"));
    store.apply(autoCard("second"));

    DrawEvent text;
    text.drawable.id = "output-1";
    text.drawable.kind = DrawableKind::Text;
    text.drawable.autoLayout = true;
    store.apply(text);

    REQUIRE(store.find("first")->position == glm::vec2(StackLayout::ORIGIN_X, StackLayout::ORIGIN_Y));
    REQUIRE(store.find("second")->position.y == StackLayout::ORIGIN_Y + StackLayout::CARD_ADVANCE);
    REQUIRE(store.find("output-1")->position.y == StackLayout::ORIGIN_Y + 2 * StackLayout::CARD_ADVANCE);

    SECTION("redrawing an auto-laid-out card keeps its slot") {
        store.apply(autoCard("first"));
        REQUIRE(store.find("first")->position.y == StackLayout::ORIGIN_Y);
    }

    SECTION("reset restarts the column") {
        store.reset();
        store.apply(autoCard("again"));
        REQUIRE(store.find("again")->position.y == StackLayout::ORIGIN_Y);
    }
}

TEST_CASE("Animate events", "[store][tween]") {
    SceneStore store;
    store.apply(quad("Btn", {100, 100}, {50, 50}, Color::Red));

    SECTION("color reaches the target once the duration has elapsed") {
        store.apply(animate("Btn", ColorValue{Color::Blue}, 0.1f));
        REQUIRE(store.activeTweenCount() == 1);

        store.advance(0.05);
        Color mid = store.find("Btn")->color;
        REQUIRE_THAT(mid.r, WithinAbs(0.5, 1e-3));
        REQUIRE_THAT(mid.b, WithinAbs(0.5, 1e-3));

        store.advance(0.05);
        REQUIRE(store.find("Btn")->color == Color::Blue);
        REQUIRE(store.activeTweenCount() == 0);
    }

    SECTION("a second animation of the same property supersedes the first") {
        store.apply(animate("Btn", ColorValue{Color::Green}, 1.0f));
        store.advance(0.25);
        store.apply(animate("Btn", ColorValue{Color::Blue}, 0.5f, Easing::EaseInOut));

        REQUIRE(store.activeTweenCount() == 1);
        const Tween* tween = store.findTween("Btn", TweenProperty::Color);
        REQUIRE(tween != nullptr);
        REQUIRE(std::get<ColorValue>(tween->to()).value == Color::Blue);
        REQUIRE(tween->duration() == 0.5f);
        REQUIRE(tween->easing() == Easing::EaseInOut);
        REQUIRE(tween->startTime() == 0.25);

        store.advance(0.5);
        REQUIRE(store.find("Btn")->color == Color::Blue);
    }

    SECTION("different properties animate independently") {
        store.apply(animate("Btn", ColorValue{Color::Blue}, 1.0f));
        store.apply(animate("Btn", ScaleValue{2.0f}, 1.0f));
        REQUIRE(store.activeTweenCount() == 2);
    }

    SECTION("zero duration applies on the next advance") {
        store.apply(animate("Btn", ScaleValue{1.5f}, 0.0f));
        store.advance(0.0);
        REQUIRE(store.find("Btn")->scale == 1.5f);
        REQUIRE(store.activeTweenCount() == 0);
    }

    SECTION("unknown targets are ignored") {
        store.apply(animate("Missing", ColorValue{Color::Blue}, 0.1f));
        REQUIRE(store.activeTweenCount() == 0);
        REQUIRE(store.find("Missing") == nullptr);
    }

    SECTION("negative dt does not move the clock") {
        store.apply(animate("Btn", ColorValue{Color::Blue}, 0.1f));
        store.advance(-1.0);
        REQUIRE(store.now() == 0.0);
        REQUIRE(store.find("Btn")->color == Color::Red);
    }

    SECTION("reset drops tweens but keeps the clock") {
        store.advance(1.0);
        store.apply(animate("Btn", ColorValue{Color::Blue}, 0.1f));
        store.reset();
        REQUIRE(store.activeTweenCount() == 0);
        REQUIRE(store.drawableCount() == 0);
        REQUIRE(store.now() == 1.0);
    }
}

TEST_CASE("Handler registration", "[store][handlers]") {
    SceneStore store;
    store.apply(quad("Btn", {0, 0}, {10, 10}));

    RegisterHandlerEvent click;
    click.targetId = "Btn";
    click.eventName = "click";
    click.reactions.push_back(animate("Btn", ScaleValue{1.2f}, 0.1f));
    store.apply(click);

    REQUIRE(store.handlerFor("Btn", "click") != nullptr);
    REQUIRE(store.handlerFor("Btn", "click")->reactions.size() == 1);
    REQUIRE(store.handlerFor("Btn", "hover") == nullptr);

    SECTION("re-registering replaces the reactions") {
        click.reactions.clear();
        store.apply(click);
        REQUIRE(store.handlers("Btn")->size() == 1);
        REQUIRE(store.handlerFor("Btn", "click")->reactions.empty());
    }

    SECTION("other event names are recorded") {
        RegisterHandlerEvent custom;
        custom.targetId = "Btn";
        custom.eventName = "doubleclick";
        store.apply(custom);
        REQUIRE(store.handlers("Btn")->size() == 2);
    }

    SECTION("unknown targets are ignored") {
        RegisterHandlerEvent orphan;
        orphan.targetId = "Missing";
        orphan.eventName = "click";
        store.apply(orphan);
        REQUIRE(store.handlers("Missing") == nullptr);
    }
}
