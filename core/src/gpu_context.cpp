// Glint - GPU context
// WebGPU setup and teardown for one GLFW window

#include <glint/gpu_context.h>
#include <glint/effects/gpu_common.h>
#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>
#include <cstring>
#include <iostream>
#include <string>

namespace glint {

namespace {

std::string messageText(WGPUStringView message, const char* fallback) {
    if (!message.data) return fallback;
    return std::string(message.data, message.length == WGPU_STRLEN ? strlen(message.data) : message.length);
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[GpuContext] Failed to request adapter: "
                  << messageText(message, "unknown error") << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[GpuContext] Failed to request device: "
                  << messageText(message, "unknown error") << std::endl;
    }
    data->done = true;
}

void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                   WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[GpuContext] WebGPU error: " << messageText(message, "unknown") << std::endl;
}

const char* backendName(WGPUBackendType type) {
    switch (type) {
        case WGPUBackendType_Metal: return "Metal";
        case WGPUBackendType_Vulkan: return "Vulkan";
        case WGPUBackendType_D3D12: return "D3D12";
        case WGPUBackendType_D3D11: return "D3D11";
        case WGPUBackendType_OpenGL: return "OpenGL";
        default: return "Other";
    }
}

} // namespace

GpuContext::~GpuContext() {
    shutdown();
}

void GpuContext::onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                              WGPUStringView message, void* userdata1, void* userdata2) {
    // Destroyed is our own release during shutdown()
    if (reason == WGPUDeviceLostReason_Destroyed) return;

    std::cerr << "[GpuContext] Device lost: " << messageText(message, "unknown") << std::endl;
    auto* self = static_cast<GpuContext*>(userdata1);
    if (self) {
        self->m_lost.store(true);
    }
}

bool GpuContext::init(GLFWwindow* window, bool vsync) {
    m_lost.store(false);

    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        std::cerr << "[GpuContext] Failed to create WebGPU instance" << std::endl;
        return false;
    }

    m_surface = glfwCreateWindowWGPUSurface(m_instance, window);
    if (!m_surface) {
        std::cerr << "[GpuContext] Failed to create surface" << std::endl;
        shutdown();
        return false;
    }

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, adapterCallback);

    // wgpu-native resolves the request before returning with AllowSpontaneous
    while (!adapterData.done) {
    }

    if (!adapterData.adapter) {
        shutdown();
        return false;
    }
    m_adapter = adapterData.adapter;

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[GpuContext] Adapter: " << messageText(info.device, "unknown")
              << " (" << backendName(info.backendType) << ")" << std::endl;
    wgpuAdapterInfoFreeMembers(info);

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = effects::gpu::toStringView("Glint Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
    }

    if (!deviceData.device) {
        shutdown();
        return false;
    }
    m_device = deviceData.device;
    m_queue = wgpuDeviceGetQueue(m_device);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);
    if (capabilities.formatCount > 0) {
        m_surfaceFormat = capabilities.formats[0];
    }
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    m_presentMode = vsync ? WGPUPresentMode_Fifo : WGPUPresentMode_Immediate;

    int width = 0, height = 0;
    glfwGetFramebufferSize(window, &width, &height);
    configure(static_cast<uint32_t>(width), static_cast<uint32_t>(height));

    std::cout << "[GpuContext] WebGPU initialized (" << width << "x" << height
              << (vsync ? ", vsync" : ", no vsync") << ")" << std::endl;
    return true;
}

void GpuContext::configure(uint32_t width, uint32_t height) {
    if (!m_surface || !m_device || width == 0 || height == 0) return;

    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.width = width;
    config.height = height;
    config.presentMode = m_presentMode;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(m_surface, &config);

    m_width = width;
    m_height = height;
}

void GpuContext::shutdown() {
    if (m_device) {
        effects::gpu::releaseSamplers(m_device);
    }
    if (m_surface && m_device) {
        wgpuSurfaceUnconfigure(m_surface);
    }
    if (m_queue) { wgpuQueueRelease(m_queue); m_queue = nullptr; }
    if (m_device) { wgpuDeviceRelease(m_device); m_device = nullptr; }
    if (m_adapter) { wgpuAdapterRelease(m_adapter); m_adapter = nullptr; }
    if (m_surface) { wgpuSurfaceRelease(m_surface); m_surface = nullptr; }
    if (m_instance) { wgpuInstanceRelease(m_instance); m_instance = nullptr; }
    m_width = 0;
    m_height = 0;
}

} // namespace glint
