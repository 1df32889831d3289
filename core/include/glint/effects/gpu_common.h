#pragma once

/**
 * @file gpu_common.h
 * @brief Shared GPU helpers for glint's passes
 *
 * - Offscreen format and render target creation
 * - Full-screen triangle vertex shader (blur, blit)
 * - Cached samplers, released per device on re-init
 * - Null-safe release helpers
 */

#include <webgpu/webgpu.h>
#include <cstdint>
#include <cstring>

namespace glint::effects::gpu {

/// Format of every offscreen target (scene raster, blur intermediates)
constexpr WGPUTextureFormat EFFECTS_FORMAT = WGPUTextureFormat_RGBA16Float;

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

/**
 * @brief Full-screen triangle vertex shader
 *
 * No vertex buffer; outputs uv with (0,0) at the top-left texel.
 * Concatenate a fragment shader that reads `input.uv`.
 */
inline constexpr const char* FULLSCREEN_VERTEX_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    var positions = array<vec2f, 3>(
        vec2f(-1.0, -1.0),
        vec2f(3.0, -1.0),
        vec2f(-1.0, 3.0)
    );
    var output: VertexOutput;
    output.position = vec4f(positions[vertexIndex], 0.0, 1.0);
    output.uv = (positions[vertexIndex] + 1.0) * 0.5;
    output.uv.y = 1.0 - output.uv.y;
    return output;
}
)";

/// Source-over alpha blending used by every blended glint pipeline
WGPUBlendState alphaBlendState();

// -----------------------------------------------------------------------------
// Samplers (cached per device; do NOT release the returned handles)
// -----------------------------------------------------------------------------

WGPUSampler getLinearClampSampler(WGPUDevice device);
WGPUSampler getNearestClampSampler(WGPUDevice device);

/// Drop every cached sampler created on this device (before device release)
void releaseSamplers(WGPUDevice device);

// -----------------------------------------------------------------------------
// Render targets
// -----------------------------------------------------------------------------

/// Texture usable as a render attachment and as a sampled input
struct RenderTarget {
    WGPUTexture texture = nullptr;
    WGPUTextureView view = nullptr;
    uint32_t width = 0;
    uint32_t height = 0;

    bool valid() const { return texture && view; }
};

/// @return An invalid target if creation failed
RenderTarget createRenderTarget(WGPUDevice device, uint32_t width, uint32_t height,
                                WGPUTextureFormat format = EFFECTS_FORMAT,
                                const char* label = "Glint Target");

/// Create a sampled RGBA8 texture from tightly packed pixels (top row first)
/// @return An invalid target if the size is zero or creation failed
RenderTarget createTexture(WGPUDevice device, WGPUQueue queue, uint32_t width, uint32_t height,
                           const uint8_t* rgba, const char* label);

/// Create a 1x1 RGBA8 texture holding the given color
RenderTarget createSolidTexture(WGPUDevice device, WGPUQueue queue,
                                uint8_t r, uint8_t g, uint8_t b, uint8_t a);

// -----------------------------------------------------------------------------
// Resource cleanup helpers
// -----------------------------------------------------------------------------

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferRelease(b); b = nullptr; }
}

inline void release(WGPUSampler& s) {
    if (s) { wgpuSamplerRelease(s); s = nullptr; }
}

inline void release(WGPUTexture& t) {
    if (t) { wgpuTextureRelease(t); t = nullptr; }
}

inline void release(WGPUTextureView& v) {
    if (v) { wgpuTextureViewRelease(v); v = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

inline void release(RenderTarget& t) {
    release(t.view);
    release(t.texture);
    t.width = 0;
    t.height = 0;
}

} // namespace glint::effects::gpu
