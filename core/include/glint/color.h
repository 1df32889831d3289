#pragma once

/**
 * @file color.h
 * @brief RGBA color with hex parsing and the runtime's named-color table
 *
 * Colors arrive from the scripting runtime as words ("blue", "赤"),
 * CSS-style hex strings or raw channel arrays. Color resolves all of them
 * to 0-1 float RGBA and converts implicitly to glm::vec4 for the GPU path.
 *
 * @par Example
 * @code
 * Color c = Color::fromName("青").value_or(Color::Gray);
 * Color mid = Color::Red.lerp(Color::Blue, 0.5f);
 * @endcode
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace glint {

class Color {
public:
    float r, g, b, a;

    /// Opaque white
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    operator glm::vec4() const { return glm::vec4(r, g, b, a); }
    glm::vec4 toVec4() const { return glm::vec4(r, g, b, a); }

    /**
     * @brief Create color from a packed hex value
     *
     * Values above 0xFFFFFF are read as 0xRRGGBBAA, everything else as an
     * opaque 0xRRGGBB.
     */
    static constexpr Color fromHex(uint32_t hex) {
        if (hex > 0xFFFFFF) {
            return Color(
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f
            );
        }
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Parse "#RRGGBB", "#RRGGBBAA" (leading # optional)
     * @return nullopt when the string is not a valid hex color
     */
    static std::optional<Color> fromHex(const std::string& hex);

    /**
     * @brief Resolve a color word or hex string
     *
     * Matching is case-insensitive for ASCII names. Accepts the basic CSS
     * names, the Japanese color words the runtime emits, and any string
     * fromHex() accepts.
     */
    static std::optional<Color> fromName(const std::string& name);

    constexpr Color withAlpha(float newAlpha) const {
        return Color(r, g, b, newAlpha);
    }

    Color lerp(const Color& other, float t) const {
        return Color(
            r + (other.r - r) * t,
            g + (other.g - g) * t,
            b + (other.b - b) * t,
            a + (other.a - a) * t
        );
    }

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }

    // Named colors
    static const Color Black;
    static const Color White;
    static const Color Gray;
    static const Color Red;
    static const Color Green;
    static const Color Blue;
    static const Color Yellow;
    static const Color Cyan;
    static const Color Magenta;
    static const Color Orange;
    static const Color Purple;
    static const Color Pink;
    static const Color Transparent;
};

inline constexpr Color Color::Black       {0.0f, 0.0f, 0.0f};
inline constexpr Color Color::White       {1.0f, 1.0f, 1.0f};
inline constexpr Color Color::Gray        {0.5f, 0.5f, 0.5f};
inline constexpr Color Color::Red         {1.0f, 0.0f, 0.0f};
inline constexpr Color Color::Green       {0.0f, 0.502f, 0.0f};
inline constexpr Color Color::Blue        {0.0f, 0.0f, 1.0f};
inline constexpr Color Color::Yellow      {1.0f, 1.0f, 0.0f};
inline constexpr Color Color::Cyan        {0.0f, 1.0f, 1.0f};
inline constexpr Color Color::Magenta     {1.0f, 0.0f, 1.0f};
inline constexpr Color Color::Orange      {1.0f, 0.647f, 0.0f};
inline constexpr Color Color::Purple      {0.502f, 0.0f, 0.502f};
inline constexpr Color Color::Pink        {1.0f, 0.753f, 0.796f};
inline constexpr Color Color::Transparent {0.0f, 0.0f, 0.0f, 0.0f};

} // namespace glint
