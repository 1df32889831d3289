// Glint - Uniform Block Manager

#include <glint/uniforms.h>
#include <glint/config.h>
#include <algorithm>
#include <string>

namespace glint {

UniformManager::UniformManager(glm::vec2 screenSize) {
    resize(screenSize);
}

void UniformManager::update(glm::vec2 screenSize, double dt) {
    if (screenSize != m_block.screenSize) {
        resize(screenSize);
    }
    // float32 accumulation, same precision the shaders see
    m_block.time += static_cast<float>(std::max(dt, 0.0));
}

void UniformManager::resize(glm::vec2 screenSize) {
    if (!(screenSize.x > 0.0f) || !(screenSize.y > 0.0f)) {
        throw ConfigError("screen size must be positive, got " +
                          std::to_string(screenSize.x) + "x" + std::to_string(screenSize.y));
    }
    m_block.screenSize = screenSize;
}

} // namespace glint
