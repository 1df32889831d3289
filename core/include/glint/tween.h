#pragma once

/**
 * @file tween.h
 * @brief Time-bounded interpolation of one drawable property
 *
 * Each animatable property is its own alternative of PropertyValue, with
 * its own interpolation rule:
 * - ColorValue: per-channel linear blend
 * - ScaleValue: linear blend
 * - ShadowValue: snaps from start to target once progress reaches 0.5
 */

#include <glint/color.h>
#include <optional>
#include <string>
#include <variant>

namespace glint {

struct Drawable;

struct ColorValue {
    Color value;
};

struct ScaleValue {
    float value = 1.0f;
};

struct ShadowValue {
    float depth = 0.0f;
};

using PropertyValue = std::variant<ColorValue, ScaleValue, ShadowValue>;

enum class TweenProperty {
    Color,
    Scale,
    Shadow,
};

enum class Easing {
    Linear,
    EaseInOut,  ///< Cubic in-out
    Elastic,    ///< Elastic out, overshoots before settling
};

/// Progress at which threshold properties jump to their target
inline constexpr float SHADOW_SNAP_PROGRESS = 0.5f;

/// Shadow depth above which a second, wider shadow layer is drawn
inline constexpr float DEEP_SHADOW_DEPTH = 10.0f;

TweenProperty propertyOf(const PropertyValue& value);
const char* propertyName(TweenProperty property);

/// Accepts English names and the runtime's Japanese aliases
std::optional<TweenProperty> parseProperty(const std::string& name);
std::optional<Easing> parseEasing(const std::string& name);

float applyEasing(Easing easing, float t);

/// Blend two values of the same property kind; t is raw progress in [0,1]
PropertyValue interpolate(const PropertyValue& from, const PropertyValue& to,
                          float t, Easing easing);

/// Read the drawable's current value for a property
PropertyValue readProperty(const Drawable& drawable, TweenProperty property);

/// Write a value back into the matching drawable field
void writeProperty(Drawable& drawable, const PropertyValue& value);

/**
 * @brief One live animation
 *
 * Created by SceneStore when an Animate event is applied. The start value
 * is captured from the drawable at that moment, so a tween replacing
 * another one continues from wherever the first left off.
 */
class Tween {
public:
    Tween(std::string targetId, PropertyValue from, PropertyValue to,
          float duration, double startTime, Easing easing = Easing::Linear);

    const std::string& targetId() const { return m_targetId; }
    TweenProperty property() const { return propertyOf(m_to); }
    const PropertyValue& from() const { return m_from; }
    const PropertyValue& to() const { return m_to; }
    float duration() const { return m_duration; }
    double startTime() const { return m_startTime; }
    Easing easing() const { return m_easing; }

    /// min(1, (now - start) / duration); a zero duration is complete at once
    float progress(double now) const;

    bool finished(double now) const { return progress(now) >= 1.0f; }

    PropertyValue sample(double now) const;

private:
    std::string m_targetId;
    PropertyValue m_from;
    PropertyValue m_to;
    float m_duration = 0.0f;
    double m_startTime = 0.0;
    Easing m_easing = Easing::Linear;
};

} // namespace glint
