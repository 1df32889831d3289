#pragma once

/**
 * @file blur_kernel.h
 * @brief 9-tap Gaussian kernel shared by the GPU blur and its CPU reference
 */

#include <glm/glm.hpp>
#include <array>
#include <vector>

namespace glint::effects::blur {

/// Taps on each side of the center
inline constexpr int TAPS_PER_SIDE = 4;

/// Center weight followed by the weights at distance 1..4
inline constexpr std::array<float, TAPS_PER_SIDE + 1> WEIGHTS = {
    0.227027f, 0.194595f, 0.121622f, 0.054054f, 0.016216f
};

/// Sum over all 9 taps (center once, side weights twice)
constexpr float weightSum() {
    float sum = WEIGHTS[0];
    for (int i = 1; i <= TAPS_PER_SIDE; ++i) {
        sum += 2.0f * WEIGHTS[i];
    }
    return sum;
}

enum class Direction {
    Horizontal,
    Vertical,
};

/// Row-major RGBA float image
struct Image {
    int width = 0;
    int height = 0;
    std::vector<glm::vec4> pixels;

    Image() = default;
    Image(int w, int h, glm::vec4 fill = glm::vec4(0.0f));

    glm::vec4& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const glm::vec4& at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }

    /// Clamp-to-edge read, same addressing as the GPU sampler
    glm::vec4 sampleClamped(int x, int y) const;
};

/**
 * @brief One separable pass
 * @throw ConfigError if the image is empty or its pixel count mismatches
 */
Image convolvePass(const Image& src, Direction direction);

/// Horizontal pass followed by the vertical pass
Image convolve(const Image& src);

} // namespace glint::effects::blur
