// Glint - Core Runtime
// Window, frame loop, runtime link, input and device recovery

#include <glint/cli.h>
#include <glint/config.h>
#include <glint/gpu_context.h>
#include <glint/renderer.h>
#include <glint/script_runtime.h>
#include <glint/session.h>
#include <glint/stdio_runtime.h>
#include <glint/websocket_runtime.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

using namespace glint;

namespace {

constexpr double HEADLESS_DT = 1.0 / 60.0;

// State reachable from GLFW callbacks
struct InputContext {
    Session* session = nullptr;
    ScriptRuntime* script = nullptr;
};

std::unique_ptr<RuntimeLink> createLink(const AppConfig& config, ScriptRuntime*& script) {
    script = nullptr;
    switch (config.runtime) {
        case RuntimeKind::Script: {
            if (config.scriptPath.empty()) {
                std::cout << "[Glint] No script given, starting with an empty scene" << std::endl;
                return nullptr;
            }
            auto runtime = ScriptRuntime::fromFile(config.scriptPath, config.linesPerTick);
            script = runtime.get();
            return runtime;
        }
        case RuntimeKind::Stdin:
            std::cout << "[Glint] Reading runtime lines from stdin" << std::endl;
            return std::make_unique<StdioRuntime>();
        case RuntimeKind::WebSocket: {
            auto runtime = std::make_unique<WebSocketRuntime>();
            if (!runtime->start(config.port)) {
                throw ConfigError("cannot listen on port " + std::to_string(config.port));
            }
            return runtime;
        }
    }
    return nullptr;
}

// True when a finite runtime has nothing more to deliver
bool linkFinished(const RuntimeLink* link, const AppConfig& config) {
    if (!link) return true;
    switch (config.runtime) {
        case RuntimeKind::Script: return static_cast<const ScriptRuntime*>(link)->exhausted();
        case RuntimeKind::Stdin: return static_cast<const StdioRuntime*>(link)->closed();
        case RuntimeKind::WebSocket: return false;
    }
    return true;
}

void printScene(const Session& session) {
    std::cout << "[Glint] " << session.store().drawableCount() << " drawables after "
              << session.frameCount() << " frames" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& d : session.store().snapshot()) {
        std::cout << "  " << d.id << " " << kindName(d.kind)
                  << " at (" << d.position.x << ", " << d.position.y << ")"
                  << " size (" << d.size.x << ", " << d.size.y << ")"
                  << " color (" << d.color.r << ", " << d.color.g << ", " << d.color.b << ", " << d.color.a << ")"
                  << " scale " << d.scale << " shadow " << d.shadow
                  << " effects " << static_cast<uint32_t>(d.effects) << std::endl;
    }
}

int runHeadless(const AppConfig& config, Session& session, RuntimeLink* link) {
    std::cout << "[Glint] Running headless" << std::endl;
    glm::vec2 screen(static_cast<float>(config.windowWidth), static_cast<float>(config.windowHeight));
    bool live = config.runtime != RuntimeKind::Script;

    while (true) {
        session.tick(HEADLESS_DT, screen);
        session.dispatchInput();

        if (config.maxFrames > 0) {
            if (session.frameCount() >= static_cast<uint64_t>(config.maxFrames)) break;
        } else if (linkFinished(link, config) && session.store().activeTweenCount() == 0 &&
                   session.bridge().pendingCount() == 0) {
            break;
        }

        if (live) {
            std::this_thread::sleep_for(std::chrono::duration<double>(HEADLESS_DT));
        }
    }

    printScene(session);
    return 0;
}

glm::vec2 cursorToFramebuffer(GLFWwindow* window, double x, double y) {
    int winW = 0, winH = 0, fbW = 0, fbH = 0;
    glfwGetWindowSize(window, &winW, &winH);
    glfwGetFramebufferSize(window, &fbW, &fbH);
    float sx = winW > 0 ? static_cast<float>(fbW) / winW : 1.0f;
    float sy = winH > 0 ? static_cast<float>(fbH) / winH : 1.0f;
    return glm::vec2(static_cast<float>(x) * sx, static_cast<float>(y) * sy);
}

void installInputCallbacks(GLFWwindow* window, InputContext* input) {
    glfwSetWindowUserPointer(window, input);

    glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int scancode, int action, int mods) {
        auto* in = static_cast<InputContext*>(glfwGetWindowUserPointer(w));
        if (!in || action != GLFW_PRESS) return;
        if (key == GLFW_KEY_R) {
            std::cout << "[Glint] Reset" << std::endl;
            in->session->reset();
            if (in->script) in->script->rewind();
        } else if (key == GLFW_KEY_ESCAPE) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
        }
    });

    glfwSetMouseButtonCallback(window, [](GLFWwindow* w, int button, int action, int mods) {
        auto* in = static_cast<InputContext*>(glfwGetWindowUserPointer(w));
        if (!in || button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_PRESS) return;
        double x = 0.0, y = 0.0;
        glfwGetCursorPos(w, &x, &y);
        in->session->queueClick(cursorToFramebuffer(w, x, y));
    });

    glfwSetCursorPosCallback(window, [](GLFWwindow* w, double x, double y) {
        auto* in = static_cast<InputContext*>(glfwGetWindowUserPointer(w));
        if (in) in->session->queueMove(cursorToFramebuffer(w, x, y));
    });
}

int runWindowed(const AppConfig& config, Session& session, ScriptRuntime* script) {
    if (!glfwInit()) {
        std::cerr << "[Glint] Failed to initialize GLFW" << std::endl;
        return 1;
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    GLFWwindow* window = glfwCreateWindow(config.windowWidth, config.windowHeight,
                                          config.windowTitle.c_str(), nullptr, nullptr);
    if (!window) {
        std::cerr << "[Glint] Failed to create window" << std::endl;
        glfwTerminate();
        return 1;
    }

    GpuContext gpu;
    if (!gpu.init(window, config.vsync)) {
        std::cerr << "[Glint] WebGPU initialization failed" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    auto renderer = std::make_unique<Renderer>(gpu, config.blur);
    if (!renderer->isValid()) {
        renderer.reset();
        gpu.shutdown();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    InputContext input{&session, script};
    installInputCallbacks(window, &input);

    int exitCode = 0;
    double lastTime = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        double now = glfwGetTime();
        double dt = now - lastTime;
        lastTime = now;

        int width = 0, height = 0;
        glfwGetFramebufferSize(window, &width, &height);

        // Minimized: keep the runtime drained but do not touch the GPU
        if (width == 0 || height == 0) {
            session.bridge().pump();
            glfwWaitEventsTimeout(0.1);
            continue;
        }

        if (static_cast<uint32_t>(width) != gpu.width() || static_cast<uint32_t>(height) != gpu.height()) {
            gpu.configure(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
        }

        FrameState frame = session.tick(dt, glm::vec2(static_cast<float>(width), static_cast<float>(height)));
        FrameResult result = renderer->render(frame, session.compositor(), config.clearColor);

        if (result == FrameResult::Lost) {
            std::cerr << "[Glint] GPU lost, re-initializing" << std::endl;
            renderer.reset();
            gpu.shutdown();
            if (!gpu.init(window, config.vsync)) {
                std::cerr << "[Glint] WebGPU re-initialization failed" << std::endl;
                exitCode = 1;
                break;
            }
            renderer = std::make_unique<Renderer>(gpu, config.blur);
            if (!renderer->isValid()) {
                exitCode = 1;
                break;
            }
            continue;
        }

        session.dispatchInput();

        if (config.maxFrames > 0 && session.frameCount() >= static_cast<uint64_t>(config.maxFrames)) {
            std::cout << "[Glint] Reached frame limit (" << config.maxFrames << ")" << std::endl;
            break;
        }
    }

    renderer.reset();
    gpu.shutdown();
    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

} // namespace

int main(int argc, char** argv) {
    AppConfig config;
    int parsed = cli::parseArgs(argc, argv, config);
    if (parsed >= 0) {
        return parsed;
    }

    std::cout << "Glint " << cli::VERSION << " - Starting..." << std::endl;

    try {
        Session session(glm::vec2(static_cast<float>(config.windowWidth),
                                  static_cast<float>(config.windowHeight)));

        ScriptRuntime* script = nullptr;
        std::unique_ptr<RuntimeLink> link = createLink(config, script);
        if (link) {
            std::cout << "[Glint] Runtime: " << link->name() << std::endl;
        }
        session.setLink(link.get());

        if (config.headless) {
            return runHeadless(config, session, link.get());
        }
        return runWindowed(config, session, script);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
