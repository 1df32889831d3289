// Glint Effects - Pipeline Builder Utility
// Fluent API for creating render pipelines with less boilerplate

#pragma once

#include <webgpu/webgpu.h>
#include <string>
#include <vector>

namespace glint::effects::gpu {

// Binding types for the builder
enum class BindingType {
    Uniform,
    Texture,
    Sampler,
};

struct BindingEntry {
    uint32_t binding;
    BindingType type;
    uint64_t size;  // For uniform buffers
    WGPUShaderStage visibility;
};

// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    PipelineBuilder(const PipelineBuilder&) = delete;
    PipelineBuilder& operator=(const PipelineBuilder&) = delete;

    PipelineBuilder& label(const char* name);

    // Shader configuration
    PipelineBuilder& shader(const std::string& wgslSource);

    // Per-vertex buffer at slot 0; without it the shader draws from vertex_index
    PipelineBuilder& vertexBuffer(uint64_t stride, std::vector<WGPUVertexAttribute> attributes);

    // Output configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format);
    PipelineBuilder& colorTargetWithBlend(WGPUTextureFormat format);

    // Binding configuration - fragment stage by default
    PipelineBuilder& uniform(uint32_t binding, uint64_t size,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);
    PipelineBuilder& texture(uint32_t binding,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);
    PipelineBuilder& sampler(uint32_t binding,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);

    // Build the pipeline; nullptr on failure
    WGPURenderPipeline build();

    // Bind group layout created by build(); ownership passes to the caller
    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }

    bool valid() const { return m_pipeline != nullptr; }

private:
    void createShaderModule();
    void createBindGroupLayout();
    void createPipelineLayout();

    WGPUDevice m_device;
    std::string m_label = "Glint Pipeline";
    std::string m_shaderSource;
    const char* m_vertexEntry = "vs_main";
    const char* m_fragmentEntry = "fs_main";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_RGBA16Float;
    bool m_useBlend = false;

    uint64_t m_vertexStride = 0;
    std::vector<WGPUVertexAttribute> m_vertexAttributes;

    std::vector<BindingEntry> m_bindings;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
};

} // namespace glint::effects::gpu
