#pragma once

/**
 * @file effect_math.h
 * @brief CPU reference for the quad effect shader
 *
 * Each function mirrors one step of the WGSL in effect_pipeline.cpp, in
 * single precision. The compositor uses projectToNdc() for overlay
 * placement, so overlay rects and rendered quads share one transform.
 */

#include <glint/drawable.h>
#include <glm/glm.hpp>

namespace glint::effects::math {

/// Horizontal shake amplitude in pixels
inline constexpr float SHAKE_AMPLITUDE = 5.0f;
/// Shake phase advance per second
inline constexpr float SHAKE_SPEED = 20.0f;
/// Shake phase change per pixel of y
inline constexpr float SHAKE_ROW_FREQUENCY = 0.1f;

/// Pulse oscillation speed, radians per second
inline constexpr float PULSE_SPEED = 3.0f;
/// Pulse term is (sin + 1) * this, so it peaks at 2x
inline constexpr float PULSE_STRENGTH = 0.2f;

/// Rainbow channel phase offsets (radians), roughly 2pi/3 apart
inline constexpr float RAINBOW_PHASE_G = 2.09f;
inline constexpr float RAINBOW_PHASE_B = 4.18f;

/// Pixel space (origin top-left, y down) to NDC (origin center, y up)
glm::vec2 projectToNdc(glm::vec2 pixel, glm::vec2 screenSize);

/// Inverse of projectToNdc()
glm::vec2 ndcToPixel(glm::vec2 ndc, glm::vec2 screenSize);

/// Shake displacement in pixels for a vertex at row y
float shakeOffset(float time, float y);

/// Vertex-stage position adjustment; returns position unchanged without Shake
glm::vec2 applyShake(glm::vec2 position, EffectFlags flags, float time);

/// Additive whitening amount, always in [0, 0.4]
float pulseTerm(float time);

/// Multiplicative tint for the Rainbow effect (alpha is 1)
glm::vec4 rainbowTint(float time, float u);

/**
 * @brief Full fragment stage
 * @param texel Texture sample at uv
 * @param color Interpolated vertex color
 */
glm::vec4 shadeFragment(glm::vec4 texel, glm::vec4 color, glm::vec2 uv,
                        EffectFlags flags, float time);

} // namespace glint::effects::math
