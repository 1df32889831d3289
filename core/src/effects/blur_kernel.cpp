// Glint Effects - Blur kernel (CPU reference)

#include <glint/effects/blur_kernel.h>
#include <glint/config.h>
#include <algorithm>

namespace glint::effects::blur {

static_assert(weightSum() > 0.99999f && weightSum() < 1.00001f, "blur weights must sum to 1");

Image::Image(int w, int h, glm::vec4 fill)
    : width(w), height(h), pixels(static_cast<size_t>(std::max(w, 0)) * std::max(h, 0), fill) {}

glm::vec4 Image::sampleClamped(int x, int y) const {
    x = std::clamp(x, 0, width - 1);
    y = std::clamp(y, 0, height - 1);
    return at(x, y);
}

Image convolvePass(const Image& src, Direction direction) {
    if (src.width <= 0 || src.height <= 0 ||
        src.pixels.size() != static_cast<size_t>(src.width) * src.height) {
        throw ConfigError("blur input must be a non-empty, fully populated image");
    }

    const int dx = direction == Direction::Horizontal ? 1 : 0;
    const int dy = direction == Direction::Vertical ? 1 : 0;

    Image dst(src.width, src.height);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            glm::vec4 sum = src.at(x, y) * WEIGHTS[0];
            for (int k = 1; k <= TAPS_PER_SIDE; ++k) {
                sum += src.sampleClamped(x + k * dx, y + k * dy) * WEIGHTS[k];
                sum += src.sampleClamped(x - k * dx, y - k * dy) * WEIGHTS[k];
            }
            dst.at(x, y) = sum;
        }
    }
    return dst;
}

Image convolve(const Image& src) {
    return convolvePass(convolvePass(src, Direction::Horizontal), Direction::Vertical);
}

} // namespace glint::effects::blur
