#pragma once

/**
 * @file gpu_context.h
 * @brief WebGPU instance, adapter, device, queue and window surface
 *
 * init() runs the synchronous setup sequence against a GLFW window and
 * shutdown() releases everything in reverse order. A lost device is
 * reported through lost(); the frame loop then calls shutdown() and
 * init() again and rebuilds every GPU resource.
 */

#include <webgpu/webgpu.h>
#include <atomic>
#include <cstdint>

struct GLFWwindow;

namespace glint {

class GpuContext {
public:
    GpuContext() = default;
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    /// @return false if any step fails; partial state is released
    bool init(GLFWwindow* window, bool vsync);
    void shutdown();

    /// Reconfigure the surface for a new framebuffer size
    void configure(uint32_t width, uint32_t height);

    bool isValid() const { return m_device != nullptr && m_surface != nullptr; }
    bool lost() const { return m_lost.load(); }

    WGPUInstance instance() const { return m_instance; }
    WGPUAdapter adapter() const { return m_adapter; }
    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPUSurface surface() const { return m_surface; }
    WGPUTextureFormat surfaceFormat() const { return m_surfaceFormat; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

private:
    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);

    WGPUInstance m_instance = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUPresentMode m_presentMode = WGPUPresentMode_Fifo;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    std::atomic<bool> m_lost{false};
};

} // namespace glint
