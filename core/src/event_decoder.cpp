// Glint - Event Decoder
// Turns tagged runtime output into scene events

#include <glint/event_decoder.h>
#include <glint/stack_layout.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <locale>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace glint {

namespace {

constexpr const char* TAG_OUTPUT = "[Output]";
constexpr const char* TAG_ANIMATION = "[Animation]";
constexpr const char* TAG_REGISTER = "[RegisterEvent]";

// Shadow depth the runtime means by "deepen"
constexpr float DEEPENED_SHADOW_DEPTH = 20.0f;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

DecodeResult fail(const std::string& reason) {
    DecodeResult result;
    result.error = reason;
    return result;
}

DecodeResult success(Event event) {
    DecodeResult result;
    result.event = std::move(event);
    return result;
}

// Values are narrowed to float; anything that would overflow is rejected
std::optional<float> toFloat(double d) {
    if (!std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max()) {
        return std::nullopt;
    }
    return static_cast<float>(d);
}

std::optional<float> numberFrom(const json& v) {
    if (v.is_number()) {
        return toFloat(v.get<double>());
    }
    if (v.is_string()) {
        auto d = parseFiniteNumber(v.get<std::string>());
        if (d) return toFloat(*d);
    }
    return std::nullopt;
}

std::optional<PropertyValue> convertValue(TweenProperty property, const json& v) {
    switch (property) {
        case TweenProperty::Color: {
            if (v.is_string()) {
                auto c = Color::fromName(trim(v.get<std::string>()));
                if (c) return PropertyValue{ColorValue{*c}};
                return std::nullopt;
            }
            if (v.is_array() && (v.size() == 3 || v.size() == 4)) {
                float ch[4] = {0.0f, 0.0f, 0.0f, 1.0f};
                for (size_t i = 0; i < v.size(); ++i) {
                    if (!v[i].is_number()) return std::nullopt;
                    double d = v[i].get<double>();
                    // Channels are normalized; NaN fails both comparisons
                    if (!(d >= 0.0 && d <= 1.0)) return std::nullopt;
                    ch[i] = static_cast<float>(d);
                }
                return PropertyValue{ColorValue{Color(ch[0], ch[1], ch[2], ch[3])}};
            }
            return std::nullopt;
        }
        case TweenProperty::Scale: {
            auto f = numberFrom(v);
            if (!f || *f < 0.0f) return std::nullopt;
            return PropertyValue{ScaleValue{*f}};
        }
        case TweenProperty::Shadow: {
            if (v.is_string()) {
                std::string word = trim(v.get<std::string>());
                if (word == "deepen" || word == "深く") {
                    return PropertyValue{ShadowValue{DEEPENED_SHADOW_DEPTH}};
                }
            }
            auto f = numberFrom(v);
            if (!f || *f < 0.0f) return std::nullopt;
            return PropertyValue{ShadowValue{*f}};
        }
    }
    return std::nullopt;
}

bool parsePair(const std::string& text, char sep, float& a, float& b) {
    size_t pos = text.find(sep);
    if (pos == std::string::npos) return false;
    auto first = parseFiniteNumber(text.substr(0, pos));
    auto second = parseFiniteNumber(text.substr(pos + 1));
    if (!first || !second) return false;
    a = static_cast<float>(*first);
    b = static_cast<float>(*second);
    return true;
}

} // namespace

std::optional<double> parseFiniteNumber(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    // Plain decimal only: no hex, no inf/nan, '.' regardless of the user's locale
    std::istringstream in(s);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::optional<AnimateEvent> parseAnimationRecord(const json& record,
                                                 const std::string& defaultTarget,
                                                 std::string& error) {
    if (!record.is_object()) {
        error = "animation record is not an object";
        return std::nullopt;
    }

    AnimateEvent event;

    auto target = record.find("target");
    if (target != record.end()) {
        if (!target->is_string() || target->get<std::string>().empty()) {
            error = "\"target\" must be a non-empty string";
            return std::nullopt;
        }
        event.targetId = target->get<std::string>();
    } else if (!defaultTarget.empty()) {
        event.targetId = defaultTarget;
    } else {
        error = "missing \"target\"";
        return std::nullopt;
    }

    auto property = record.find("property");
    if (property == record.end() || !property->is_string()) {
        error = "missing or non-string \"property\"";
        return std::nullopt;
    }
    auto kind = parseProperty(property->get<std::string>());
    if (!kind) {
        error = "unknown property '" + property->get<std::string>() + "'";
        return std::nullopt;
    }

    auto duration = record.find("duration");
    if (duration == record.end() || !duration->is_number()) {
        error = "missing or non-numeric \"duration\"";
        return std::nullopt;
    }
    auto seconds = toFloat(duration->get<double>());
    if (!seconds || *seconds < 0.0f) {
        error = "\"duration\" must be a finite number >= 0";
        return std::nullopt;
    }
    event.duration = *seconds;

    auto easing = record.find("easing");
    if (easing != record.end()) {
        if (!easing->is_string()) {
            error = "\"easing\" must be a string";
            return std::nullopt;
        }
        auto e = parseEasing(easing->get<std::string>());
        if (!e) {
            error = "unknown easing '" + easing->get<std::string>() + "'";
            return std::nullopt;
        }
        event.easing = *e;
    }

    auto value = record.find("value");
    if (value == record.end()) {
        error = "missing \"value\"";
        return std::nullopt;
    }
    auto converted = convertValue(*kind, *value);
    if (!converted) {
        error = std::string("value ") + value->dump() + " is not a valid " + propertyName(*kind);
        return std::nullopt;
    }
    event.value = *converted;
    return event;
}

DecodeResult EventDecoder::decode(const std::string& line) {
    if (trim(line).empty()) {
        return DecodeResult{};
    }

    // Earliest tag wins; runtimes prefix lines with their own log tags
    struct TagMatch { const char* tag; size_t pos; };
    TagMatch best{nullptr, std::string::npos};
    for (const char* tag : {TAG_OUTPUT, TAG_ANIMATION, TAG_REGISTER}) {
        size_t pos = line.find(tag);
        if (pos < best.pos) {
            best = {tag, pos};
        }
    }

    if (!best.tag) {
        return success(UnparsedEvent{line});
    }

    std::string payload = trim(line.substr(best.pos + std::strlen(best.tag)));

    DecodeResult result;
    if (best.tag == TAG_OUTPUT) {
        result = decodeOutput(payload);
    } else if (best.tag == TAG_ANIMATION) {
        result = decodeAnimation(payload);
    } else {
        result = decodeRegisterEvent(payload);
    }

    if (!result.ok()) {
        return reject(line, result.error);
    }
    return result;
}

DecodeResult EventDecoder::reject(const std::string& line, const std::string& reason) {
    ++m_failures;
    std::cerr << "[EventDecoder] Dropped line (" << reason << "): " << line << "\n";
    return fail(reason);
}

DecodeResult EventDecoder::decodeOutput(const std::string& payload) {
    // [style kind 'label' attrs...]
    static const std::regex s_cardPattern(R"(^\[(\S+)\s+(\S+)\s+'([^']*)'(.*)\]$)");

    std::smatch match;
    if (std::regex_match(payload, match, s_cardPattern)) {
        Drawable card;
        card.kind = DrawableKind::Card;
        card.style = match[1].str();
        card.component = match[2].str();
        card.label = match[3].str();
        card.id = card.label;
        card.size = StackLayout::defaultSize(DrawableKind::Card);
        card.color = Color::fromName(card.style).value_or(Color::Gray);
        card.autoLayout = true;

        std::istringstream attrs(match[4].str());
        std::string attr;
        while (attrs >> attr) {
            if (attr.rfind("id=", 0) == 0) {
                if (attr.size() > 3) card.id = attr.substr(3);
            } else if (attr.rfind("at=", 0) == 0) {
                if (!parsePair(attr.substr(3), ',', card.position.x, card.position.y)) {
                    return fail("bad position '" + attr + "'");
                }
                card.autoLayout = false;
            } else if (attr.rfind("size=", 0) == 0) {
                float w = 0.0f, h = 0.0f;
                if (!parsePair(attr.substr(5), 'x', w, h) || w <= 0.0f || h <= 0.0f) {
                    return fail("bad size '" + attr + "'");
                }
                card.size = glm::vec2(w, h);
            } else if (attr.rfind("image=", 0) == 0) {
                if (attr.size() == 6) {
                    return fail("empty image path");
                }
                card.image = attr.substr(6);
            } else if (attr == "pulse") {
                card.effects |= EffectFlags::Pulse;
            } else if (attr == "shake") {
                card.effects |= EffectFlags::Shake;
            } else if (attr == "rainbow") {
                card.effects |= EffectFlags::Rainbow;
            }
        }

        if (card.id.empty()) {
            return fail("card has neither a label nor an id");
        }
        return success(DrawEvent{card});
    }

    Drawable output;
    output.id = "output-" + std::to_string(m_nextOutputId++);
    output.kind = parseFiniteNumber(payload) ? DrawableKind::Number : DrawableKind::Text;
    output.label = payload;
    output.size = StackLayout::defaultSize(output.kind);
    output.color = Color::White;
    output.autoLayout = true;
    return success(DrawEvent{output});
}

DecodeResult EventDecoder::decodeAnimation(const std::string& payload) {
    json record;
    try {
        record = json::parse(payload);
    } catch (const json::exception& e) {
        return fail(std::string("JSON parse error: ") + e.what());
    }

    std::string error;
    auto event = parseAnimationRecord(record, "", error);
    if (!event) {
        return fail(error);
    }
    return success(*event);
}

DecodeResult EventDecoder::decodeRegisterEvent(const std::string& payload) {
    std::istringstream in(payload);
    RegisterHandlerEvent event;
    in >> event.targetId >> event.eventName;
    if (event.targetId.empty() || event.eventName.empty()) {
        return fail("expected '<id> <event>'");
    }

    std::string tail;
    std::getline(in, tail);
    tail = trim(tail);
    if (tail.empty()) {
        return success(event);
    }

    json reactions;
    try {
        reactions = json::parse(tail);
    } catch (const json::exception& e) {
        return fail(std::string("reaction JSON parse error: ") + e.what());
    }
    if (!reactions.is_array()) {
        return fail("reactions must be a JSON array");
    }

    for (size_t i = 0; i < reactions.size(); ++i) {
        std::string error;
        auto reaction = parseAnimationRecord(reactions[i], event.targetId, error);
        if (!reaction) {
            return fail("reaction " + std::to_string(i) + ": " + error);
        }
        event.reactions.push_back(*reaction);
    }
    return success(event);
}

} // namespace glint
