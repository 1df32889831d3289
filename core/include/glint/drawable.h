#pragma once

/**
 * @file drawable.h
 * @brief Renderable scene element and its effect bitmask
 */

#include <glint/color.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>

namespace glint {

/**
 * @brief Per-drawable effect selection
 *
 * Closed set combined as a bitmask. The values are shared with the WGSL
 * shader, so new effects reserve the next free bit.
 */
enum class EffectFlags : uint32_t {
    None    = 0,
    Pulse   = 1u << 0,  ///< Additive whitening, (sin(3t)+1)*0.2
    Shake   = 1u << 1,  ///< Horizontal displacement in the vertex stage
    Rainbow = 1u << 2,  ///< Three phase-shifted sine tints across uv.x
};

/// Every bit the shaders understand
inline constexpr uint32_t EFFECT_FLAGS_MASK = 0x7u;

constexpr EffectFlags operator|(EffectFlags a, EffectFlags b) {
    return static_cast<EffectFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr EffectFlags operator&(EffectFlags a, EffectFlags b) {
    return static_cast<EffectFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline EffectFlags& operator|=(EffectFlags& a, EffectFlags b) {
    a = a | b;
    return a;
}

constexpr bool hasFlag(EffectFlags set, EffectFlags flag) {
    return (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) != 0;
}

/// Drop bits outside the defined set
constexpr EffectFlags sanitizeFlags(uint32_t bits) {
    return static_cast<EffectFlags>(bits & EFFECT_FLAGS_MASK);
}

enum class DrawableKind {
    Quad,    ///< Plain colored rectangle
    Card,    ///< Styled component with a label
    Text,    ///< Free text output
    Number,  ///< Text output that parsed as a finite number
};

const char* kindName(DrawableKind kind);

/// Texture coordinate rectangle mapped across the quad
struct UvRect {
    float u0 = 0.0f;
    float v0 = 0.0f;
    float u1 = 1.0f;
    float v1 = 1.0f;
};

/**
 * @brief A quad in pixel space plus the state tweens animate
 *
 * color, scale and shadow are the animatable properties. A Draw event for
 * an existing id replaces geometry, color, label and effects but keeps the
 * current scale and shadow.
 */
struct Drawable {
    std::string id;
    DrawableKind kind = DrawableKind::Quad;
    glm::vec2 position{0.0f};  ///< Top-left corner, pixels
    glm::vec2 size{0.0f};      ///< Width/height, pixels
    Color color = Color::White;
    UvRect uv;
    EffectFlags effects = EffectFlags::None;
    std::string label;         ///< Card label or text content
    std::string style;         ///< Card style tag as written by the runtime
    std::string component;     ///< Card kind word ("Button", "Panel", ...)
    std::string image;         ///< Image file sampled under color, empty = plain color

    float scale = 1.0f;        ///< Uniform scale about the quad center
    float shadow = 0.0f;       ///< Drop shadow depth in pixels, 0 = none

    bool autoLayout = false;   ///< Position is assigned by StackLayout

    /// Screen rectangle after scale is applied
    glm::vec4 bounds() const;

    bool contains(glm::vec2 point) const;
};

} // namespace glint
