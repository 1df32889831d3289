#pragma once

/**
 * @file session.h
 * @brief The CPU half of one frame tick
 *
 * Owns the bridge, the store, the uniforms and the overlay, and runs them
 * in the fixed tick order:
 *
 *   restart check -> poll link -> drain -> apply (reactions, then events)
 *   -> advance tweens -> update uniforms -> rebuild overlay
 *
 * The renderer consumes the returned FrameState. Pointer input queued
 * during the frame is dispatched by dispatchInput() after present.
 */

#include <glint/compositor.h>
#include <glint/event_bridge.h>
#include <glint/scene_store.h>
#include <glint/uniforms.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace glint {

class RuntimeLink;

/// Everything the renderer needs for one frame
struct FrameState {
    std::vector<Drawable> drawables;  ///< Resolved snapshot, draw order
    GlobalUniforms uniforms;
    size_t eventsApplied = 0;
};

class Session {
public:
    /// @throw ConfigError on a non-positive screen size
    explicit Session(glm::vec2 screenSize);

    /// Non-owning
    void setLink(RuntimeLink* link) { m_bridge.setLink(link); }

    /**
     * @brief Run one tick
     * @param dt Seconds since the previous tick
     * @param screenSize Current drawable size
     * @throw ConfigError on a non-positive screen size
     */
    FrameState tick(double dt, glm::vec2 screenSize);

    void queueClick(glm::vec2 pixel) { m_compositor.queuePress(pixel); }
    void queueMove(glm::vec2 pixel) { m_compositor.queueMove(pixel); }

    /// Deliver queued pointer input; call after the frame is presented
    void dispatchInput();

    /// Clear the scene (R key, runtime restart)
    void reset();

    EventBridge& bridge() { return m_bridge; }
    SceneStore& store() { return m_store; }
    const SceneStore& store() const { return m_store; }
    const Compositor& compositor() const { return m_compositor; }
    const UniformManager& uniforms() const { return m_uniforms; }
    uint64_t frameCount() const { return m_frameCount; }

private:
    EventBridge m_bridge;
    SceneStore m_store;
    UniformManager m_uniforms;
    Compositor m_compositor;
    std::vector<AnimateEvent> m_pendingReactions;
    uint64_t m_frameCount = 0;
};

} // namespace glint
