#pragma once

/**
 * @file effect_pipeline.h
 * @brief Draws the scene's quads with per-drawable effects
 *
 * Renders a QuadBatch into an offscreen EFFECTS_FORMAT target the size of
 * the screen. Effects are selected per vertex by the EffectFlags bits:
 *
 * | Bit | Effect | Stage |
 * |-----|--------|-------|
 * | 1 | Pulse | fragment, additive |
 * | 2 | Shake | vertex, x displacement |
 * | 4 | Rainbow | fragment, multiplicative |
 *
 * Bind group 0: Globals uniform (both stages), the drawable's image texture
 * and a linear sampler. Quads without an image, and images that fail to
 * load, sample a 1x1 white texture so the vertex color shows unchanged.
 * Image textures are loaded once per path and kept until the pipeline is
 * destroyed.
 */

#include <glint/color.h>
#include <glint/effects/gpu_common.h>
#include <glint/effects/quad_batch.h>
#include <glint/uniforms.h>
#include <webgpu/webgpu.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace glint::effects {

class EffectPipeline {
public:
    EffectPipeline(WGPUDevice device, WGPUQueue queue);
    ~EffectPipeline();

    EffectPipeline(const EffectPipeline&) = delete;
    EffectPipeline& operator=(const EffectPipeline&) = delete;

    bool isValid() const { return m_valid; }

    /// Recreate the offscreen target; no-op if the size is unchanged
    void resize(uint32_t width, uint32_t height);

    /// Upload the frame's globals; must precede encode()
    void writeUniforms(const GlobalUniforms& globals);

    /// Upload the batch, growing the GPU buffers when needed and loading
    /// any image the batch references for the first time
    void upload(const QuadBatch& batch);

    /// Clear the target and draw the uploaded quads
    void encode(WGPUCommandEncoder encoder, const Color& clearColor);

    WGPUTextureView outputView() const { return m_target.view; }

private:
    bool createPipeline();
    bool ensureCapacity(WGPUBuffer& buffer, uint64_t& capacity, uint64_t needed,
                        WGPUBufferUsage usage, const char* label);
    WGPUBindGroup createBindGroup(WGPUTextureView view, const char* label);
    WGPUBindGroup bindGroupFor(const std::string& image);
    void cleanup();

    struct ImageEntry {
        gpu::RenderTarget texture;
        WGPUBindGroup bindGroup = nullptr;  // null when the load failed
    };

    WGPUDevice m_device;
    WGPUQueue m_queue;

    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;  // white texture
    WGPUSampler m_sampler = nullptr;       // shared, not owned
    WGPUBuffer m_uniformBuffer = nullptr;
    gpu::RenderTarget m_whiteTexture;
    gpu::RenderTarget m_target;

    WGPUBuffer m_vertexBuffer = nullptr;
    WGPUBuffer m_indexBuffer = nullptr;
    uint64_t m_vertexCapacity = 0;  // bytes
    uint64_t m_indexCapacity = 0;   // bytes
    uint32_t m_indexCount = 0;
    std::vector<DrawRange> m_ranges;
    std::unordered_map<std::string, ImageEntry> m_images;

    bool m_valid = false;
};

} // namespace glint::effects
