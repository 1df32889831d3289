// Glint Effects - Quad effect pipeline
// Per-drawable Pulse / Shake / Rainbow driven by a flags vertex attribute

#include <glint/effects/effect_pipeline.h>
#include <glint/effects/pipeline_builder.h>
#include <glint/io/image_loader.h>
#include <iostream>
#include <string>

namespace glint::effects {

namespace {

constexpr uint64_t INITIAL_QUAD_CAPACITY = 256;

const char* EFFECT_SHADER = R"(
struct Globals {
    screenSize: vec2f,
    time: f32,
    _pad: f32,
};

@group(0) @binding(0) var<uniform> globals: Globals;
@group(0) @binding(1) var baseTex: texture_2d<f32>;
@group(0) @binding(2) var baseSampler: sampler;

const PULSE: u32 = 1u;
const SHAKE: u32 = 2u;
const RAINBOW: u32 = 4u;

struct VertexInput {
    @location(0) position: vec2f,
    @location(1) color: vec4f,
    @location(2) uv: vec2f,
    @location(3) effectFlags: u32,
};

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec4f,
    @location(1) uv: vec2f,
    @location(2) @interpolate(flat) effectFlags: u32,
};

@vertex
fn vs_main(input: VertexInput) -> VertexOutput {
    var pos = input.position;
    if ((input.effectFlags & SHAKE) != 0u) {
        pos.x += sin(globals.time * 20.0 + pos.y * 0.1) * 5.0;
    }

    let ndc = vec2f(
        (pos.x / globals.screenSize.x) * 2.0 - 1.0,
        (1.0 - pos.y / globals.screenSize.y) * 2.0 - 1.0
    );

    var output: VertexOutput;
    output.position = vec4f(ndc, 0.0, 1.0);
    output.color = input.color;
    output.uv = input.uv;
    output.effectFlags = input.effectFlags;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    var base = textureSample(baseTex, baseSampler, input.uv) * input.color;

    if ((input.effectFlags & PULSE) != 0u) {
        let p = (sin(globals.time * 3.0) + 1.0) * 0.2;
        base += vec4f(p, p, p, 0.0);
    }

    if ((input.effectFlags & RAINBOW) != 0u) {
        let t = globals.time + input.uv.x;
        let tint = vec4f(
            sin(t) * 0.5 + 0.5,
            sin(t + 2.09) * 0.5 + 0.5,
            sin(t + 4.18) * 0.5 + 0.5,
            1.0
        );
        base *= tint;
    }

    return base;
}
)";

} // namespace

EffectPipeline::EffectPipeline(WGPUDevice device, WGPUQueue queue)
    : m_device(device)
    , m_queue(queue)
{
    m_valid = createPipeline();
}

EffectPipeline::~EffectPipeline() {
    cleanup();
}

bool EffectPipeline::createPipeline() {
    std::vector<WGPUVertexAttribute> attributes(4);
    attributes[0] = {};
    attributes[0].format = WGPUVertexFormat_Float32x2;  // position
    attributes[0].offset = offsetof(QuadVertex, position);
    attributes[0].shaderLocation = 0;
    attributes[1] = {};
    attributes[1].format = WGPUVertexFormat_Float32x4;  // color
    attributes[1].offset = offsetof(QuadVertex, color);
    attributes[1].shaderLocation = 1;
    attributes[2] = {};
    attributes[2].format = WGPUVertexFormat_Float32x2;  // uv
    attributes[2].offset = offsetof(QuadVertex, uv);
    attributes[2].shaderLocation = 2;
    attributes[3] = {};
    attributes[3].format = WGPUVertexFormat_Uint32;     // effect flags
    attributes[3].offset = offsetof(QuadVertex, effectFlags);
    attributes[3].shaderLocation = 3;

    gpu::PipelineBuilder builder(m_device);
    builder.label("Glint Effect Pipeline")
           .shader(EFFECT_SHADER)
           .vertexBuffer(sizeof(QuadVertex), std::move(attributes))
           .colorTargetWithBlend(gpu::EFFECTS_FORMAT)
           .uniform(0, sizeof(GlobalUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment)
           .texture(1)
           .sampler(2);
    m_pipeline = builder.build();
    m_bindGroupLayout = builder.bindGroupLayout();
    if (!m_pipeline) {
        return false;
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = gpu::toStringView("Glint Globals");
    bufferDesc.size = sizeof(GlobalUniforms);
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);

    m_whiteTexture = gpu::createSolidTexture(m_device, m_queue, 255, 255, 255, 255);
    m_sampler = gpu::getLinearClampSampler(m_device);
    if (!m_uniformBuffer || !m_whiteTexture.valid() || !m_sampler) {
        std::cerr << "[EffectPipeline] Failed to create resources\n";
        return false;
    }

    m_bindGroup = createBindGroup(m_whiteTexture.view, "Glint Effect Bind Group");

    if (!ensureCapacity(m_vertexBuffer, m_vertexCapacity, INITIAL_QUAD_CAPACITY * 4 * sizeof(QuadVertex),
                        WGPUBufferUsage_Vertex, "Glint Quad Vertices") ||
        !ensureCapacity(m_indexBuffer, m_indexCapacity, INITIAL_QUAD_CAPACITY * 6 * sizeof(uint32_t),
                        WGPUBufferUsage_Index, "Glint Quad Indices")) {
        return false;
    }

    return m_bindGroup != nullptr;
}

WGPUBindGroup EffectPipeline::createBindGroup(WGPUTextureView view, const char* label) {
    WGPUBindGroupEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].buffer = m_uniformBuffer;
    entries[0].offset = 0;
    entries[0].size = sizeof(GlobalUniforms);
    entries[1].binding = 1;
    entries[1].textureView = view;
    entries[2].binding = 2;
    entries[2].sampler = m_sampler;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.label = gpu::toStringView(label);
    bindGroupDesc.layout = m_bindGroupLayout;
    bindGroupDesc.entryCount = 3;
    bindGroupDesc.entries = entries;
    return wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc);
}

WGPUBindGroup EffectPipeline::bindGroupFor(const std::string& image) {
    if (image.empty()) return m_bindGroup;

    auto it = m_images.find(image);
    if (it == m_images.end()) {
        ImageEntry entry;
        io::ImageData data = io::loadImage(image);
        if (data.valid()) {
            entry.texture = gpu::createTexture(m_device, m_queue, static_cast<uint32_t>(data.width),
                                               static_cast<uint32_t>(data.height), data.pixels.data(),
                                               image.c_str());
            if (entry.texture.valid()) {
                entry.bindGroup = createBindGroup(entry.texture.view, "Glint Image Bind Group");
            }
        }
        if (!entry.bindGroup) {
            std::cerr << "[EffectPipeline] Missing texture " << image << ", using white\n";
            gpu::release(entry.texture);
        }
        it = m_images.emplace(image, std::move(entry)).first;
    }
    return it->second.bindGroup ? it->second.bindGroup : m_bindGroup;
}

bool EffectPipeline::ensureCapacity(WGPUBuffer& buffer, uint64_t& capacity, uint64_t needed,
                                    WGPUBufferUsage usage, const char* label) {
    if (buffer && capacity >= needed) return true;

    uint64_t newCapacity = capacity > 0 ? capacity : needed;
    while (newCapacity < needed) {
        newCapacity *= 2;
    }

    gpu::release(buffer);
    WGPUBufferDescriptor desc = {};
    desc.label = gpu::toStringView(label);
    desc.size = newCapacity;
    desc.usage = usage | WGPUBufferUsage_CopyDst;
    buffer = wgpuDeviceCreateBuffer(m_device, &desc);
    if (!buffer) {
        std::cerr << "[EffectPipeline] Failed to allocate " << label << " (" << newCapacity << " bytes)\n";
        capacity = 0;
        return false;
    }
    capacity = newCapacity;
    return true;
}

void EffectPipeline::resize(uint32_t width, uint32_t height) {
    if (m_target.valid() && m_target.width == width && m_target.height == height) return;

    gpu::release(m_target);
    m_target = gpu::createRenderTarget(m_device, width, height, gpu::EFFECTS_FORMAT, "Glint Scene Target");
}

void EffectPipeline::writeUniforms(const GlobalUniforms& globals) {
    if (!m_uniformBuffer) return;
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &globals, sizeof(GlobalUniforms));
}

void EffectPipeline::upload(const QuadBatch& batch) {
    m_indexCount = 0;
    m_ranges.clear();
    if (batch.empty()) return;

    uint64_t vertexBytes = batch.vertices().size() * sizeof(QuadVertex);
    uint64_t indexBytes = batch.indices().size() * sizeof(uint32_t);
    if (!ensureCapacity(m_vertexBuffer, m_vertexCapacity, vertexBytes,
                        WGPUBufferUsage_Vertex, "Glint Quad Vertices") ||
        !ensureCapacity(m_indexBuffer, m_indexCapacity, indexBytes,
                        WGPUBufferUsage_Index, "Glint Quad Indices")) {
        return;
    }

    wgpuQueueWriteBuffer(m_queue, m_vertexBuffer, 0, batch.vertices().data(), vertexBytes);
    wgpuQueueWriteBuffer(m_queue, m_indexBuffer, 0, batch.indices().data(), indexBytes);
    m_indexCount = static_cast<uint32_t>(batch.indices().size());
    m_ranges = batch.ranges();
    for (const DrawRange& range : m_ranges) {
        bindGroupFor(range.image);
    }
}

void EffectPipeline::encode(WGPUCommandEncoder encoder, const Color& clearColor) {
    if (!m_valid || !m_target.valid()) return;

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = m_target.view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {clearColor.r, clearColor.g, clearColor.b, clearColor.a};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (m_indexCount > 0) {
        wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_vertexBuffer, 0, m_vertexCapacity);
        wgpuRenderPassEncoderSetIndexBuffer(pass, m_indexBuffer, WGPUIndexFormat_Uint32, 0, m_indexCapacity);
        for (const DrawRange& range : m_ranges) {
            wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroupFor(range.image), 0, nullptr);
            wgpuRenderPassEncoderDrawIndexed(pass, range.indexCount, 1, range.firstIndex, 0, 0);
        }
    }
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

void EffectPipeline::cleanup() {
    for (auto& [path, entry] : m_images) {
        gpu::release(entry.bindGroup);
        gpu::release(entry.texture);
    }
    m_images.clear();
    m_ranges.clear();
    gpu::release(m_bindGroup);
    gpu::release(m_pipeline);
    gpu::release(m_bindGroupLayout);
    gpu::release(m_uniformBuffer);
    gpu::release(m_vertexBuffer);
    gpu::release(m_indexBuffer);
    gpu::release(m_whiteTexture);
    gpu::release(m_target);
    m_vertexCapacity = 0;
    m_indexCapacity = 0;
    m_indexCount = 0;
    m_valid = false;
}

} // namespace glint::effects
