/**
 * @file test_event_decoder.cpp
 * @brief Unit tests for decoding tagged runtime lines into scene events
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <glint/event_decoder.h>
#include <glint/stack_layout.h>
#include <iterator>

using namespace glint;
using Catch::Matchers::WithinAbs;

namespace {

template <typename T>
const T& as(const DecodeResult& result) {
    REQUIRE(result.ok());
    REQUIRE(result.event.has_value());
    REQUIRE(std::holds_alternative<T>(*result.event));
    return std::get<T>(*result.event);
}

} // namespace

TEST_CASE("Output lines: cards", "[decoder][output]") {
    EventDecoder decoder;

    SECTION("card with position, size and effects") {
        auto result = decoder.decode("[Output] [red Button 'Btn' at=100,100 size=50x50 pulse shake]");
        const Drawable& d = as<DrawEvent>(result).drawable;

        REQUIRE(d.id == "Btn");
        REQUIRE(d.kind == DrawableKind::Card);
        REQUIRE(d.style == "red");
        REQUIRE(d.component == "Button");
        REQUIRE(d.label == "Btn");
        REQUIRE(d.position == glm::vec2(100.0f, 100.0f));
        REQUIRE(d.size == glm::vec2(50.0f, 50.0f));
        REQUIRE(d.color == Color::Red);
        REQUIRE(d.effects == (EffectFlags::Pulse | EffectFlags::Shake));
        REQUIRE_FALSE(d.autoLayout);
    }

    SECTION("card without position is laid out automatically") {
        auto result = decoder.decode("[Output] [青 Panel 'Settings']");
        const Drawable& d = as<DrawEvent>(result).drawable;

        REQUIRE(d.autoLayout);
        REQUIRE(d.color == Color::Blue);
        REQUIRE(d.size == StackLayout::defaultSize(DrawableKind::Card));
        REQUIRE(d.effects == EffectFlags::None);
    }

    SECTION("explicit id overrides the label") {
        auto result = decoder.decode("[Output] [green Button 'OK' id=confirm rainbow]");
        const Drawable& d = as<DrawEvent>(result).drawable;
        REQUIRE(d.id == "confirm");
        REQUIRE(d.label == "OK");
        REQUIRE(d.effects == EffectFlags::Rainbow);
    }

    SECTION("image attribute") {
        auto result = decoder.decode("[Output] [white Panel 'Logo' image=assets/logo.png size=64x64]");
        const Drawable& d = as<DrawEvent>(result).drawable;
        REQUIRE(d.image == "assets/logo.png");
        REQUIRE(d.color == Color::White);
        REQUIRE(d.size == glm::vec2(64.0f, 64.0f));

        auto plain = decoder.decode("[Output] [white Panel 'Plain']");
        REQUIRE(as<DrawEvent>(plain).drawable.image.empty());

        REQUIRE_FALSE(decoder.decode("[Output] [white Panel 'Logo' image=]").ok());
    }

    SECTION("unknown style falls back to gray") {
        auto result = decoder.decode("[Output] [fancy Button 'X']");
        REQUIRE(as<DrawEvent>(result).drawable.color == Color::Gray);
    }

    SECTION("bad size is rejected") {
        auto result = decoder.decode("[Output] [red Button 'Btn' size=0x5]");
        REQUIRE_FALSE(result.ok());
        REQUIRE_FALSE(result.event.has_value());
        REQUIRE(decoder.failureCount() == 1);
    }

    SECTION("bad position is rejected") {
        auto result = decoder.decode("[Output] [red Button 'Btn' at=ten,5]");
        REQUIRE_FALSE(result.ok());
    }
}

TEST_CASE("Output lines: text and numbers", "[decoder][output]") {
    EventDecoder decoder;

    auto textResult = decoder.decode("[Output] Hello world");
    const Drawable& text = as<DrawEvent>(textResult).drawable;
    REQUIRE(text.kind == DrawableKind::Text);
    REQUIRE(text.id == "output-1");
    REQUIRE(text.label == "Hello world");
    REQUIRE(text.autoLayout);

    auto numberResult = decoder.decode("[Output] 3.5");
    const Drawable& number = as<DrawEvent>(numberResult).drawable;
    REQUIRE(number.kind == DrawableKind::Number);
    REQUIRE(number.id == "output-2");

    SECTION("non-finite values are text") {
        auto inf = decoder.decode("[Output] inf");
        REQUIRE(as<DrawEvent>(inf).drawable.kind == DrawableKind::Text);
    }

    SECTION("hex literals are text") {
        auto hex = decoder.decode("[Output] 0x1A");
        const Drawable& d = as<DrawEvent>(hex).drawable;
        REQUIRE(d.kind == DrawableKind::Text);
        REQUIRE(d.label == "0x1A");
    }

    SECTION("resetIds restarts numbering") {
        decoder.resetIds();
        auto again = decoder.decode("[Output] again");
        REQUIRE(as<DrawEvent>(again).drawable.id == "output-1");
    }
}

TEST_CASE("Line framing", "[decoder]") {
    EventDecoder decoder;

    SECTION("blank lines produce nothing") {
        auto result = decoder.decode("   ");
        REQUIRE(result.ok());
        REQUIRE_FALSE(result.event.has_value());
    }

    SECTION("untagged lines are kept as unparsed") {
        auto result = decoder.decode("runtime> booting");
        REQUIRE(as<UnparsedEvent>(result).raw == "runtime> booting");
    }

    SECTION("tags after a log prefix are found") {
        auto result = decoder.decode("12:00:01 [Output] hi");
        REQUIRE(as<DrawEvent>(result).drawable.label == "hi");
    }
}

TEST_CASE("Animation lines", "[decoder][animation]") {
    EventDecoder decoder;

    SECTION("well-formed record") {
        auto result = decoder.decode(
            R"([Animation] {"target": "Btn", "property": "color", "value": "blue", "duration": 0.1})");
        const AnimateEvent& a = as<AnimateEvent>(result);
        REQUIRE(a.targetId == "Btn");
        REQUIRE(a.property() == TweenProperty::Color);
        REQUIRE(std::get<ColorValue>(a.value).value == Color::Blue);
        REQUIRE_THAT(a.duration, WithinAbs(0.1, 1e-6));
        REQUIRE(a.easing == Easing::Linear);
    }

    SECTION("runtime property and color words") {
        auto result = decoder.decode(
            R"([Animation] {"target": "Btn", "property": "色", "value": "赤", "duration": 1})");
        REQUIRE(std::get<ColorValue>(as<AnimateEvent>(result).value).value == Color::Red);
    }

    SECTION("color arrays, scale strings, deepened shadows") {
        auto color = decoder.decode(
            R"([Animation] {"target": "a", "property": "color", "value": [0, 1, 0], "duration": 0})");
        REQUIRE(std::get<ColorValue>(as<AnimateEvent>(color).value).value == Color(0.0f, 1.0f, 0.0f, 1.0f));

        auto scale = decoder.decode(
            R"([Animation] {"target": "a", "property": "scale", "value": "1.5", "duration": 0.2, "easing": "elastic"})");
        const AnimateEvent& s = as<AnimateEvent>(scale);
        REQUIRE(std::get<ScaleValue>(s.value).value == 1.5f);
        REQUIRE(s.easing == Easing::Elastic);

        auto shadow = decoder.decode(
            R"([Animation] {"target": "a", "property": "shadow", "value": "deepen", "duration": 0.3})");
        REQUIRE(std::get<ShadowValue>(as<AnimateEvent>(shadow).value).depth == 20.0f);
    }

    SECTION("invalid JSON is dropped and counted") {
        auto result = decoder.decode("[Animation] not-json");
        REQUIRE_FALSE(result.ok());
        REQUIRE_FALSE(result.event.has_value());
        REQUIRE(decoder.failureCount() == 1);

        // Decoder keeps working
        auto next = decoder.decode("[Output] still here");
        REQUIRE(as<DrawEvent>(next).drawable.label == "still here");
    }

    SECTION("invalid records") {
        const char* bad[] = {
            R"([Animation] {"property": "color", "value": "red", "duration": 1})",
            R"([Animation] {"target": "a", "property": "opacity", "value": 1, "duration": 1})",
            R"([Animation] {"target": "a", "property": "color", "value": "red"})",
            R"([Animation] {"target": "a", "property": "color", "value": "red", "duration": -1})",
            R"([Animation] {"target": "a", "property": "color", "value": "notacolor", "duration": 1})",
            R"([Animation] {"target": "a", "property": "scale", "value": -2, "duration": 1})",
            R"([Animation] {"target": "a", "property": "scale", "value": 2, "duration": 1, "easing": "bounce"})",
            R"([Animation] [1, 2, 3])",
            R"([Animation] {"target": "a", "property": "color", "value": [2, -1, 0], "duration": 1})",
            R"([Animation] {"target": "a", "property": "color", "value": [0, 0, 1, 1.5], "duration": 1})",
            R"([Animation] {"target": "a", "property": "color", "value": [1e39, 0, 0], "duration": 1})",
            R"([Animation] {"target": "a", "property": "scale", "value": 1e39, "duration": 1})",
            R"([Animation] {"target": "a", "property": "scale", "value": 2, "duration": 1e39})",
        };
        for (const char* line : bad) {
            INFO(line);
            REQUIRE_FALSE(decoder.decode(line).ok());
        }
        REQUIRE(decoder.failureCount() == std::size(bad));
    }
}

TEST_CASE("RegisterEvent lines", "[decoder][register]") {
    EventDecoder decoder;

    SECTION("plain registration") {
        auto result = decoder.decode("[RegisterEvent] Btn click");
        const auto& r = as<RegisterHandlerEvent>(result);
        REQUIRE(r.targetId == "Btn");
        REQUIRE(r.eventName == "click");
        REQUIRE(r.reactions.empty());
    }

    SECTION("reactions default to the registered drawable") {
        auto result = decoder.decode(
            R"([RegisterEvent] Btn hover [{"property": "scale", "value": 1.2, "duration": 0.2}, {"target": "Other", "property": "color", "value": "red", "duration": 0}])");
        const auto& r = as<RegisterHandlerEvent>(result);
        REQUIRE(r.eventName == "hover");
        REQUIRE(r.reactions.size() == 2);
        REQUIRE(r.reactions[0].targetId == "Btn");
        REQUIRE(r.reactions[1].targetId == "Other");
    }

    SECTION("missing event name") {
        REQUIRE_FALSE(decoder.decode("[RegisterEvent] Btn").ok());
    }

    SECTION("reactions must be a valid array") {
        REQUIRE_FALSE(decoder.decode(R"([RegisterEvent] Btn click {"property": "scale"})").ok());
        REQUIRE_FALSE(decoder.decode(R"([RegisterEvent] Btn click [{"property": "scale"}])").ok());
    }
}

TEST_CASE("Finite number parsing", "[decoder]") {
    REQUIRE(parseFiniteNumber("42") == 42.0);
    REQUIRE(parseFiniteNumber(" -1.5 ") == -1.5);
    REQUIRE_FALSE(parseFiniteNumber("12abc").has_value());
    REQUIRE_FALSE(parseFiniteNumber("nan").has_value());
    REQUIRE_FALSE(parseFiniteNumber("").has_value());
    REQUIRE(parseFiniteNumber("1e3") == 1000.0);
    REQUIRE_FALSE(parseFiniteNumber("0x1A").has_value());
    REQUIRE_FALSE(parseFiniteNumber("1,5").has_value());
    REQUIRE_FALSE(parseFiniteNumber("1e999").has_value());
    REQUIRE_FALSE(parseFiniteNumber("inf").has_value());
}

TEST_CASE("Outbound encoding", "[decoder]") {
    REQUIRE(encodeOutbound(OutboundEvent{"Btn", "click"}) == "[Event] Btn click");
}
