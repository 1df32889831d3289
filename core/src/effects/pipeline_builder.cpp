// Glint Effects - Pipeline Builder Implementation

#include <glint/effects/pipeline_builder.h>
#include <glint/effects/gpu_common.h>
#include <iostream>

namespace glint::effects::gpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // m_bindGroupLayout and m_pipeline are handed to the caller
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::label(const char* name) {
    m_label = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexBuffer(uint64_t stride,
                                               std::vector<WGPUVertexAttribute> attributes) {
    m_vertexStride = stride;
    m_vertexAttributes = std::move(attributes);
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_colorFormat = format;
    m_useBlend = false;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTargetWithBlend(WGPUTextureFormat format) {
    m_colorFormat = format;
    m_useBlend = true;
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::texture(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Texture, 0, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::sampler(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Sampler, 0, visibility});
    return *this;
}

void PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(m_label.c_str());
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

void PipelineBuilder::createBindGroupLayout() {
    std::vector<WGPUBindGroupLayoutEntry> entries(m_bindings.size());

    for (size_t i = 0; i < m_bindings.size(); ++i) {
        auto& entry = entries[i];
        auto& binding = m_bindings[i];

        entry = {};
        entry.binding = binding.binding;
        entry.visibility = binding.visibility;

        switch (binding.type) {
            case BindingType::Uniform:
                entry.buffer.type = WGPUBufferBindingType_Uniform;
                entry.buffer.minBindingSize = binding.size;
                break;
            case BindingType::Texture:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
            case BindingType::Sampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
        }
    }

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
}

void PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
}

WGPURenderPipeline PipelineBuilder::build() {
    createShaderModule();
    if (!m_shaderModule) {
        std::cerr << "[PipelineBuilder] Failed to create shader module for " << m_label << "\n";
        return nullptr;
    }
    createBindGroupLayout();
    createPipelineLayout();
    if (!m_bindGroupLayout || !m_pipelineLayout) {
        std::cerr << "[PipelineBuilder] Failed to create layouts for " << m_label << "\n";
        return nullptr;
    }

    WGPUBlendState blendState = alphaBlendState();

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    if (m_useBlend) {
        colorTarget.blend = &blendState;
    }

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView(m_fragmentEntry);
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPUVertexBufferLayout vertexBufferLayout = {};
    vertexBufferLayout.arrayStride = m_vertexStride;
    vertexBufferLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexBufferLayout.attributeCount = m_vertexAttributes.size();
    vertexBufferLayout.attributes = m_vertexAttributes.data();

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry);
    if (!m_vertexAttributes.empty()) {
        pipelineDesc.vertex.bufferCount = 1;
        pipelineDesc.vertex.buffers = &vertexBufferLayout;
    }
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    if (!m_pipeline) {
        std::cerr << "[PipelineBuilder] Failed to create " << m_label << "\n";
    }
    return m_pipeline;
}

} // namespace glint::effects::gpu
