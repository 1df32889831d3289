#pragma once

// Glint - Display
// Blits the scene raster to the surface and draws overlay labels

#include <glint/color.h>
#include <webgpu/webgpu.h>
#include <string>
#include <vector>

namespace glint {

class Display {
public:
    Display(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat);
    ~Display();

    // Non-copyable
    Display(const Display&) = delete;
    Display& operator=(const Display&) = delete;

    // Blit a texture to the render target
    void blit(WGPURenderPassEncoder pass, WGPUTextureView texture);

    // Queue a label; everything queued is drawn by the next drawText()
    void queueText(const std::string& text, float x, float y, float scale, const Color& color);

    // Upload queued labels and draw them in one call, then clear the queue
    void drawText(WGPURenderPassEncoder pass);

    size_t queuedGlyphs() const { return m_textVertices.size() / FLOATS_PER_GLYPH; }

    // Update screen size for blit viewport and text projection
    void setScreenSize(int width, int height);

    bool isValid() const { return m_valid; }

private:
    bool createBlitPipeline();
    bool createTextPipeline();
    bool ensureTextCapacity(uint64_t bytes);
    void shutdown();

    WGPUDevice m_device;
    WGPUQueue m_queue;
    WGPUTextureFormat m_surfaceFormat;

    // Blit resources
    WGPURenderPipeline m_blitPipeline = nullptr;
    WGPUBindGroupLayout m_blitBindGroupLayout = nullptr;
    WGPUBindGroup m_blitBindGroup = nullptr;
    WGPUTextureView m_lastBlitTexture = nullptr;

    // Text resources
    WGPURenderPipeline m_textPipeline = nullptr;
    WGPUTexture m_fontTexture = nullptr;
    WGPUTextureView m_fontTextureView = nullptr;
    WGPUBindGroupLayout m_textBindGroupLayout = nullptr;
    WGPUBindGroup m_textBindGroup = nullptr;
    WGPUBuffer m_textUniformBuffer = nullptr;
    WGPUBuffer m_textVertexBuffer = nullptr;
    uint64_t m_textVertexCapacity = 0;
    std::vector<float> m_textVertices;

    static constexpr int FONT_CHAR_WIDTH = 8;
    static constexpr int FONT_CHAR_HEIGHT = 8;
    static constexpr int FONT_CHARS_PER_ROW = 16;
    static constexpr int FONT_TEXTURE_WIDTH = 128;
    static constexpr int FONT_TEXTURE_HEIGHT = 64;
    static constexpr size_t FLOATS_PER_GLYPH = 6 * 8;  // 6 vertices: pos(2) + uv(2) + color(4)
    static constexpr size_t INITIAL_TEXT_GLYPHS = 1024;

    int m_screenWidth = 1280;
    int m_screenHeight = 720;

    bool m_valid = false;
};

} // namespace glint
