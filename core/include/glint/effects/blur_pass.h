#pragma once

/**
 * @file blur_pass.h
 * @brief Two-pass separable 9-tap blur over the scene raster
 *
 * Horizontal pass into an intermediate target, vertical pass into the
 * output target. Each pass has its own uniform buffer so both writes
 * survive until the command buffer is submitted. Weights come from
 * blur::WEIGHTS (blur_kernel.h).
 */

#include <glint/effects/gpu_common.h>
#include <webgpu/webgpu.h>

namespace glint::effects {

class BlurPass {
public:
    BlurPass(WGPUDevice device, WGPUQueue queue);
    ~BlurPass();

    BlurPass(const BlurPass&) = delete;
    BlurPass& operator=(const BlurPass&) = delete;

    bool isValid() const { return m_valid; }

    /// Recreate the intermediate and output targets for a new size
    void resize(uint32_t width, uint32_t height);

    /// Record both passes reading @p inputView; returns false if not ready
    bool encode(WGPUCommandEncoder encoder, WGPUTextureView inputView);

    WGPUTextureView outputView() const { return m_output.view; }

private:
    struct PassUniforms {
        float texelW;
        float texelH;
        float dirX;
        float dirY;
    };
    static_assert(sizeof(PassUniforms) == 16, "blur uniforms must be 16 bytes");

    bool createPipeline();
    WGPUBindGroup createBindGroup(WGPUBuffer uniforms, WGPUTextureView source);
    void runPass(WGPUCommandEncoder encoder, WGPUBindGroup bindGroup, WGPUTextureView target);
    void releaseBindGroups();
    void cleanup();

    WGPUDevice m_device;
    WGPUQueue m_queue;

    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBuffer m_horizontalUniforms = nullptr;
    WGPUBuffer m_verticalUniforms = nullptr;

    gpu::RenderTarget m_temp;
    gpu::RenderTarget m_output;

    // Cached against the input view they were built for
    WGPUTextureView m_boundInput = nullptr;
    WGPUBindGroup m_horizontalBindGroup = nullptr;
    WGPUBindGroup m_verticalBindGroup = nullptr;

    bool m_valid = false;
};

} // namespace glint::effects
