#pragma once

/**
 * @file renderer.h
 * @brief Encodes and presents one frame
 *
 * Pass order within the frame's single command encoder:
 *   effect pass -> horizontal blur -> vertical blur (if enabled)
 *   -> composite (blit + overlay labels) to the surface
 *
 * All GPU resources belong to the GpuContext's device; the Renderer must
 * be destroyed before the context is shut down.
 */

#include <glint/color.h>
#include <glint/display.h>
#include <glint/effects/blur_pass.h>
#include <glint/effects/effect_pipeline.h>
#include <glint/effects/quad_batch.h>
#include <memory>

namespace glint {

class Compositor;
class GpuContext;
struct FrameState;

enum class FrameResult {
    Presented,
    Skipped,    ///< Nothing to render into (minimized, acquire timeout)
    Lost,       ///< Surface or device gone; re-initialize the GPU side
};

class Renderer {
public:
    /// @param context Must outlive the renderer
    Renderer(GpuContext& context, bool blur);

    bool isValid() const;

    void setBlur(bool enabled) { m_blurEnabled = enabled; }
    bool blurEnabled() const { return m_blurEnabled; }

    FrameResult render(const FrameState& frame, const Compositor& compositor, const Color& clearColor);

private:
    void resize(uint32_t width, uint32_t height);

    GpuContext& m_context;
    std::unique_ptr<effects::EffectPipeline> m_effects;
    std::unique_ptr<effects::BlurPass> m_blur;
    std::unique_ptr<Display> m_display;
    effects::QuadBatch m_batch;
    bool m_blurEnabled = false;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
};

} // namespace glint
