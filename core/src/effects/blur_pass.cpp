// Glint Effects - Separable blur
// 9-tap Gaussian, horizontal then vertical

#include <glint/effects/blur_pass.h>
#include <glint/effects/blur_kernel.h>
#include <glint/effects/pipeline_builder.h>
#include <iostream>
#include <string>

namespace glint::effects {

namespace {

std::string buildBlurShader() {
    std::string weights;
    for (size_t i = 0; i < blur::WEIGHTS.size(); ++i) {
        if (i > 0) weights += ", ";
        weights += std::to_string(blur::WEIGHTS[i]);
    }

    std::string fragment = R"(
struct BlurUniforms {
    texel: vec2f,
    direction: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: BlurUniforms;
@group(0) @binding(1) var inputTex: texture_2d<f32>;
@group(0) @binding(2) var texSampler: sampler;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    var weights = array<f32, 5>()" + weights + R"();
    let step = uniforms.texel * uniforms.direction;

    var color = textureSample(inputTex, texSampler, input.uv) * weights[0];
    for (var i = 1; i < 5; i++) {
        let offset = step * f32(i);
        color += textureSample(inputTex, texSampler, input.uv + offset) * weights[i];
        color += textureSample(inputTex, texSampler, input.uv - offset) * weights[i];
    }
    return color;
}
)";

    return std::string(gpu::FULLSCREEN_VERTEX_SHADER) + fragment;
}

} // namespace

BlurPass::BlurPass(WGPUDevice device, WGPUQueue queue)
    : m_device(device)
    , m_queue(queue)
{
    m_valid = createPipeline();
}

BlurPass::~BlurPass() {
    cleanup();
}

bool BlurPass::createPipeline() {
    gpu::PipelineBuilder builder(m_device);
    builder.label("Glint Blur")
           .shader(buildBlurShader())
           .colorTarget(gpu::EFFECTS_FORMAT)
           .uniform(0, sizeof(PassUniforms))
           .texture(1)
           .sampler(2);
    m_pipeline = builder.build();
    m_bindGroupLayout = builder.bindGroupLayout();
    if (!m_pipeline) {
        return false;
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.size = sizeof(PassUniforms);
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    bufferDesc.label = gpu::toStringView("Glint Blur H Uniforms");
    m_horizontalUniforms = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
    bufferDesc.label = gpu::toStringView("Glint Blur V Uniforms");
    m_verticalUniforms = wgpuDeviceCreateBuffer(m_device, &bufferDesc);

    if (!m_horizontalUniforms || !m_verticalUniforms) {
        std::cerr << "[BlurPass] Failed to create uniform buffers\n";
        return false;
    }
    return true;
}

void BlurPass::resize(uint32_t width, uint32_t height) {
    if (m_output.valid() && m_output.width == width && m_output.height == height) return;

    releaseBindGroups();
    gpu::release(m_temp);
    gpu::release(m_output);
    m_temp = gpu::createRenderTarget(m_device, width, height, gpu::EFFECTS_FORMAT, "Glint Blur Temp");
    m_output = gpu::createRenderTarget(m_device, width, height, gpu::EFFECTS_FORMAT, "Glint Blur Output");

    float texelW = 1.0f / static_cast<float>(width);
    float texelH = 1.0f / static_cast<float>(height);
    PassUniforms horizontal = {texelW, texelH, 1.0f, 0.0f};
    PassUniforms vertical = {texelW, texelH, 0.0f, 1.0f};
    wgpuQueueWriteBuffer(m_queue, m_horizontalUniforms, 0, &horizontal, sizeof(PassUniforms));
    wgpuQueueWriteBuffer(m_queue, m_verticalUniforms, 0, &vertical, sizeof(PassUniforms));
}

WGPUBindGroup BlurPass::createBindGroup(WGPUBuffer uniforms, WGPUTextureView source) {
    WGPUBindGroupEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].buffer = uniforms;
    entries[0].offset = 0;
    entries[0].size = sizeof(PassUniforms);
    entries[1].binding = 1;
    entries[1].textureView = source;
    entries[2].binding = 2;
    entries[2].sampler = gpu::getLinearClampSampler(m_device);

    WGPUBindGroupDescriptor desc = {};
    desc.layout = m_bindGroupLayout;
    desc.entryCount = 3;
    desc.entries = entries;
    return wgpuDeviceCreateBindGroup(m_device, &desc);
}

void BlurPass::runPass(WGPUCommandEncoder encoder, WGPUBindGroup bindGroup, WGPUTextureView target) {
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 0.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

bool BlurPass::encode(WGPUCommandEncoder encoder, WGPUTextureView inputView) {
    if (!m_valid || !inputView || !m_temp.valid() || !m_output.valid()) return false;

    if (inputView != m_boundInput || !m_horizontalBindGroup || !m_verticalBindGroup) {
        releaseBindGroups();
        m_horizontalBindGroup = createBindGroup(m_horizontalUniforms, inputView);
        m_verticalBindGroup = createBindGroup(m_verticalUniforms, m_temp.view);
        if (!m_horizontalBindGroup || !m_verticalBindGroup) {
            std::cerr << "[BlurPass] Failed to create bind groups\n";
            releaseBindGroups();
            return false;
        }
        m_boundInput = inputView;
    }

    runPass(encoder, m_horizontalBindGroup, m_temp.view);
    runPass(encoder, m_verticalBindGroup, m_output.view);
    return true;
}

void BlurPass::releaseBindGroups() {
    gpu::release(m_horizontalBindGroup);
    gpu::release(m_verticalBindGroup);
    m_boundInput = nullptr;
}

void BlurPass::cleanup() {
    releaseBindGroups();
    gpu::release(m_pipeline);
    gpu::release(m_bindGroupLayout);
    gpu::release(m_horizontalUniforms);
    gpu::release(m_verticalUniforms);
    gpu::release(m_temp);
    gpu::release(m_output);
    m_valid = false;
}

} // namespace glint::effects
