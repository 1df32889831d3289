// Glint Effects - CPU reference for the quad shader

#include <glint/effects/effect_math.h>
#include <cmath>

namespace glint::effects::math {

glm::vec2 projectToNdc(glm::vec2 pixel, glm::vec2 screenSize) {
    return glm::vec2(
        (pixel.x / screenSize.x) * 2.0f - 1.0f,
        (1.0f - pixel.y / screenSize.y) * 2.0f - 1.0f
    );
}

glm::vec2 ndcToPixel(glm::vec2 ndc, glm::vec2 screenSize) {
    return glm::vec2(
        (ndc.x + 1.0f) * 0.5f * screenSize.x,
        (1.0f - (ndc.y + 1.0f) * 0.5f) * screenSize.y
    );
}

float shakeOffset(float time, float y) {
    return std::sin(time * SHAKE_SPEED + y * SHAKE_ROW_FREQUENCY) * SHAKE_AMPLITUDE;
}

glm::vec2 applyShake(glm::vec2 position, EffectFlags flags, float time) {
    if (hasFlag(flags, EffectFlags::Shake)) {
        position.x += shakeOffset(time, position.y);
    }
    return position;
}

float pulseTerm(float time) {
    return (std::sin(time * PULSE_SPEED) + 1.0f) * PULSE_STRENGTH;
}

glm::vec4 rainbowTint(float time, float u) {
    return glm::vec4(
        std::sin(time + u) * 0.5f + 0.5f,
        std::sin(time + u + RAINBOW_PHASE_G) * 0.5f + 0.5f,
        std::sin(time + u + RAINBOW_PHASE_B) * 0.5f + 0.5f,
        1.0f
    );
}

glm::vec4 shadeFragment(glm::vec4 texel, glm::vec4 color, glm::vec2 uv,
                        EffectFlags flags, float time) {
    glm::vec4 base = texel * color;
    if (hasFlag(flags, EffectFlags::Pulse)) {
        float p = pulseTerm(time);
        base += glm::vec4(p, p, p, 0.0f);
    }
    if (hasFlag(flags, EffectFlags::Rainbow)) {
        base *= rainbowTint(time, uv.x);
    }
    return base;
}

} // namespace glint::effects::math
