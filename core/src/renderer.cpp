// Glint - Renderer

#include <glint/renderer.h>
#include <glint/compositor.h>
#include <glint/gpu_context.h>
#include <glint/session.h>
#include <webgpu/wgpu.h>  // wgpuDevicePoll
#include <iostream>

namespace glint {

Renderer::Renderer(GpuContext& context, bool blur)
    : m_context(context)
    , m_blurEnabled(blur)
{
    m_effects = std::make_unique<effects::EffectPipeline>(context.device(), context.queue());
    m_blur = std::make_unique<effects::BlurPass>(context.device(), context.queue());
    m_display = std::make_unique<Display>(context.device(), context.queue(), context.surfaceFormat());

    if (!isValid()) {
        std::cerr << "[Renderer] Pipeline creation failed" << std::endl;
    }
}

bool Renderer::isValid() const {
    return m_effects->isValid() && m_blur->isValid() && m_display->isValid();
}

void Renderer::resize(uint32_t width, uint32_t height) {
    if (width == m_width && height == m_height) return;

    m_width = width;
    m_height = height;
    m_effects->resize(width, height);
    m_blur->resize(width, height);
    m_display->setScreenSize(static_cast<int>(width), static_cast<int>(height));
}

FrameResult Renderer::render(const FrameState& frame, const Compositor& compositor, const Color& clearColor) {
    if (m_context.lost()) return FrameResult::Lost;

    uint32_t width = m_context.width();
    uint32_t height = m_context.height();
    if (width == 0 || height == 0) return FrameResult::Skipped;

    WGPUSurfaceTexture surfaceTexture;
    wgpuSurfaceGetCurrentTexture(m_context.surface(), &surfaceTexture);
    switch (surfaceTexture.status) {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            return FrameResult::Skipped;
        default:
            std::cerr << "[Renderer] Surface texture unavailable (status "
                      << surfaceTexture.status << ")" << std::endl;
            if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
            return FrameResult::Lost;
    }

    resize(width, height);

    // Uniforms first: the effect pass reads them in this submission
    m_effects->writeUniforms(frame.uniforms);
    m_batch.build(frame.drawables);
    m_effects->upload(m_batch);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_context.surfaceFormat();
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_context.device(), &encoderDesc);

    m_effects->encode(encoder, clearColor);

    WGPUTextureView sceneView = m_effects->outputView();
    if (m_blurEnabled && m_blur->encode(encoder, sceneView)) {
        sceneView = m_blur->outputView();
    }

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {clearColor.r, clearColor.g, clearColor.b, clearColor.a};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);

    m_display->blit(pass, sceneView);
    for (const auto& label : compositor.labels()) {
        m_display->queueText(label.text, label.position.x, label.position.y, label.scale, label.color);
    }
    m_display->drawText(pass);

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_context.queue(), 1, &cmdBuffer);

    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(m_context.surface());
    wgpuDevicePoll(m_context.device(), false, nullptr);

    // wgpu-native: release the surface texture after present
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);

    return FrameResult::Presented;
}

} // namespace glint
