// Glint - Tween interpolation

#include <glint/tween.h>
#include <glint/drawable.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace glint {

namespace {

// Absorbs float rounding in (start + duration) - start
constexpr double COMPLETION_EPSILON = 1e-6;

std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

float clamp01(float v) {
    return std::min(1.0f, std::max(0.0f, v));
}

ColorValue blend(const ColorValue& a, const ColorValue& b, float, float eased) {
    Color c = a.value.lerp(b.value, eased);
    return {Color(clamp01(c.r), clamp01(c.g), clamp01(c.b), clamp01(c.a))};
}

ScaleValue blend(const ScaleValue& a, const ScaleValue& b, float, float eased) {
    return {a.value + (b.value - a.value) * eased};
}

ShadowValue blend(const ShadowValue& a, const ShadowValue& b, float t, float) {
    return t >= SHADOW_SNAP_PROGRESS ? b : a;
}

} // namespace

TweenProperty propertyOf(const PropertyValue& value) {
    switch (value.index()) {
        case 0: return TweenProperty::Color;
        case 1: return TweenProperty::Scale;
        default: return TweenProperty::Shadow;
    }
}

const char* propertyName(TweenProperty property) {
    switch (property) {
        case TweenProperty::Color:  return "color";
        case TweenProperty::Scale:  return "scale";
        case TweenProperty::Shadow: return "shadow";
    }
    return "unknown";
}

std::optional<TweenProperty> parseProperty(const std::string& name) {
    static const std::unordered_map<std::string, TweenProperty> s_properties = {
        {"color", TweenProperty::Color},
        {"colour", TweenProperty::Color},
        {"background", TweenProperty::Color},
        {"色", TweenProperty::Color},
        {"背景", TweenProperty::Color},
        {"scale", TweenProperty::Scale},
        {"size", TweenProperty::Scale},
        {"サイズ", TweenProperty::Scale},
        {"大きさ", TweenProperty::Scale},
        {"shadow", TweenProperty::Shadow},
        {"影", TweenProperty::Shadow},
    };
    auto it = s_properties.find(lowercase(name));
    if (it == s_properties.end()) return std::nullopt;
    return it->second;
}

std::optional<Easing> parseEasing(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "linear") return Easing::Linear;
    if (key == "easeinout" || key == "ease-in-out" || key == "ease_in_out") return Easing::EaseInOut;
    if (key == "elastic") return Easing::Elastic;
    return std::nullopt;
}

float applyEasing(Easing easing, float t) {
    switch (easing) {
        case Easing::Linear:
            return t;
        case Easing::EaseInOut:
            if (t < 0.5f) return 4.0f * t * t * t;
            return 1.0f - std::pow(-2.0f * t + 2.0f, 3.0f) / 2.0f;
        case Easing::Elastic: {
            if (t <= 0.0f) return 0.0f;
            if (t >= 1.0f) return 1.0f;
            const float c4 = (2.0f * 3.14159265359f) / 3.0f;
            return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * c4) + 1.0f;
        }
    }
    return t;
}

PropertyValue interpolate(const PropertyValue& from, const PropertyValue& to,
                          float t, Easing easing) {
    t = clamp01(t);
    float eased = applyEasing(easing, t);
    return std::visit([&](const auto& start) -> PropertyValue {
        using T = std::decay_t<decltype(start)>;
        const T* end = std::get_if<T>(&to);
        if (!end) return to;
        return blend(start, *end, t, eased);
    }, from);
}

PropertyValue readProperty(const Drawable& drawable, TweenProperty property) {
    switch (property) {
        case TweenProperty::Color:  return ColorValue{drawable.color};
        case TweenProperty::Scale:  return ScaleValue{drawable.scale};
        case TweenProperty::Shadow: return ShadowValue{drawable.shadow};
    }
    return ColorValue{drawable.color};
}

void writeProperty(Drawable& drawable, const PropertyValue& value) {
    if (auto* c = std::get_if<ColorValue>(&value)) {
        drawable.color = c->value;
    } else if (auto* s = std::get_if<ScaleValue>(&value)) {
        drawable.scale = s->value;
    } else if (auto* sh = std::get_if<ShadowValue>(&value)) {
        drawable.shadow = sh->depth;
    }
}

Tween::Tween(std::string targetId, PropertyValue from, PropertyValue to,
             float duration, double startTime, Easing easing)
    : m_targetId(std::move(targetId))
    , m_from(std::move(from))
    , m_to(std::move(to))
    , m_duration(std::max(0.0f, duration))
    , m_startTime(startTime)
    , m_easing(easing)
{
}

float Tween::progress(double now) const {
    if (m_duration <= 0.0f) return 1.0f;
    double elapsed = now - m_startTime;
    if (elapsed <= 0.0) return 0.0f;
    if (elapsed + COMPLETION_EPSILON >= m_duration) return 1.0f;
    return static_cast<float>(elapsed / m_duration);
}

PropertyValue Tween::sample(double now) const {
    float t = progress(now);
    if (t >= 1.0f) return m_to;
    return interpolate(m_from, m_to, t, m_easing);
}

} // namespace glint
