#pragma once

/**
 * @file uniforms.h
 * @brief Global per-frame shader inputs
 */

#include <glm/glm.hpp>

namespace glint {

/// Matches the WGSL `Globals` struct (binding 0 of every glint pipeline)
struct GlobalUniforms {
    glm::vec2 screenSize{1.0f, 1.0f};  ///< Pixels, both components > 0
    float time = 0.0f;                 ///< Seconds since start, never decreases
    float _pad = 0.0f;
};

static_assert(sizeof(GlobalUniforms) == 16, "GlobalUniforms must match the 16-byte WGSL layout");

/**
 * @brief Owns the CPU copy of GlobalUniforms
 *
 * The renderer uploads block() once per frame before encoding any pass.
 */
class UniformManager {
public:
    UniformManager() = default;

    /// @throw ConfigError if either component is not positive
    explicit UniformManager(glm::vec2 screenSize);

    /**
     * @brief Per-frame update
     * @param screenSize Current surface size; must be positive
     * @param dt Frame delta in seconds, negative values count as 0
     * @throw ConfigError on a non-positive screen size
     */
    void update(glm::vec2 screenSize, double dt);

    /// Window resize notification
    /// @throw ConfigError on a non-positive size
    void resize(glm::vec2 screenSize);

    const GlobalUniforms& block() const { return m_block; }
    glm::vec2 screenSize() const { return m_block.screenSize; }
    float time() const { return m_block.time; }

private:
    GlobalUniforms m_block;
};

} // namespace glint
