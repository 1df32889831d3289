// Glint Effects - GPU Common Utilities Implementation

#include <glint/effects/gpu_common.h>
#include <iostream>
#include <unordered_map>

namespace glint::effects::gpu {

// =============================================================================
// Sampler Cache
// =============================================================================

// Cache key combines device pointer and sampler type
struct SamplerKey {
    WGPUDevice device;
    int type;  // 0=linear_clamp, 1=nearest_clamp

    bool operator==(const SamplerKey& other) const {
        return device == other.device && type == other.type;
    }
};

struct SamplerKeyHash {
    size_t operator()(const SamplerKey& k) const {
        return std::hash<void*>()(k.device) ^ (std::hash<int>()(k.type) << 1);
    }
};

static std::unordered_map<SamplerKey, WGPUSampler, SamplerKeyHash> s_samplerCache;

static WGPUSampler cachedSampler(WGPUDevice device, int type, WGPUFilterMode filter) {
    SamplerKey key{device, type};
    auto it = s_samplerCache.find(key);
    if (it != s_samplerCache.end()) {
        return it->second;
    }

    WGPUSamplerDescriptor desc = {};
    desc.addressModeU = WGPUAddressMode_ClampToEdge;
    desc.addressModeV = WGPUAddressMode_ClampToEdge;
    desc.addressModeW = WGPUAddressMode_ClampToEdge;
    desc.magFilter = filter;
    desc.minFilter = filter;
    desc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    desc.lodMinClamp = 0.0f;
    desc.lodMaxClamp = 1.0f;
    desc.maxAnisotropy = 1;
    WGPUSampler sampler = wgpuDeviceCreateSampler(device, &desc);
    if (sampler) {
        s_samplerCache[key] = sampler;
    }
    return sampler;
}

WGPUSampler getLinearClampSampler(WGPUDevice device) {
    return cachedSampler(device, 0, WGPUFilterMode_Linear);
}

WGPUSampler getNearestClampSampler(WGPUDevice device) {
    return cachedSampler(device, 1, WGPUFilterMode_Nearest);
}

void releaseSamplers(WGPUDevice device) {
    for (auto it = s_samplerCache.begin(); it != s_samplerCache.end();) {
        if (it->first.device == device) {
            wgpuSamplerRelease(it->second);
            it = s_samplerCache.erase(it);
        } else {
            ++it;
        }
    }
}

WGPUBlendState alphaBlendState() {
    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;
    return blendState;
}

// =============================================================================
// Render Targets
// =============================================================================

static WGPUTextureView createView(WGPUTexture texture, WGPUTextureFormat format) {
    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    return wgpuTextureCreateView(texture, &viewDesc);
}

RenderTarget createRenderTarget(WGPUDevice device, uint32_t width, uint32_t height,
                                WGPUTextureFormat format, const char* label) {
    RenderTarget target;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(label);
    texDesc.size.width = width;
    texDesc.size.height = height;
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = format;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_RenderAttachment;
    target.texture = wgpuDeviceCreateTexture(device, &texDesc);
    if (!target.texture) {
        std::cerr << "[GPU] Failed to create " << label << " (" << width << "x" << height << ")\n";
        return target;
    }

    target.view = createView(target.texture, format);
    target.width = width;
    target.height = height;
    return target;
}

RenderTarget createTexture(WGPUDevice device, WGPUQueue queue, uint32_t width, uint32_t height,
                           const uint8_t* rgba, const char* label) {
    RenderTarget target;
    if (width == 0 || height == 0 || !rgba) {
        return target;
    }

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(label);
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {width, height, 1};
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    target.texture = wgpuDeviceCreateTexture(device, &texDesc);
    if (!target.texture) {
        return target;
    }

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = 4 * width;
    dataLayout.rowsPerImage = height;

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = target.texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUExtent3D writeSize = {width, height, 1};
    size_t dataSize = static_cast<size_t>(width) * height * 4;
    wgpuQueueWriteTexture(queue, &destination, rgba, dataSize, &dataLayout, &writeSize);

    target.view = createView(target.texture, WGPUTextureFormat_RGBA8Unorm);
    target.width = width;
    target.height = height;
    return target;
}

RenderTarget createSolidTexture(WGPUDevice device, WGPUQueue queue,
                                uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    const uint8_t pixel[4] = {r, g, b, a};
    return createTexture(device, queue, 1, 1, pixel, "Solid Texture");
}

} // namespace glint::effects::gpu
