// Glint - Configuration

#include <glint/config.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace glint {

std::optional<RuntimeKind> parseRuntimeKind(const std::string& name) {
    if (name == "script") return RuntimeKind::Script;
    if (name == "stdin" || name == "stdio") return RuntimeKind::Stdin;
    if (name == "websocket" || name == "ws") return RuntimeKind::WebSocket;
    return std::nullopt;
}

void AppConfig::validate() const {
    if (windowWidth <= 0 || windowHeight <= 0) {
        throw ConfigError("window size must be positive, got " +
                          std::to_string(windowWidth) + "x" + std::to_string(windowHeight));
    }
    if (linesPerTick < 0) {
        throw ConfigError("linesPerTick must be >= 0");
    }
    if (maxFrames < 0) {
        throw ConfigError("frame limit must be >= 0");
    }
    if (runtime == RuntimeKind::WebSocket && (port < 1 || port > 65535)) {
        throw ConfigError("port " + std::to_string(port) + " is outside 1..65535");
    }
}

void applyConfigJson(AppConfig& config, const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        if (j.contains("window")) {
            const json& window = j.at("window");
            config.windowWidth = window.value("width", config.windowWidth);
            config.windowHeight = window.value("height", config.windowHeight);
            config.windowTitle = window.value("title", config.windowTitle);
        }

        config.blur = j.value("blur", config.blur);
        config.vsync = j.value("vsync", config.vsync);

        if (j.contains("clearColor")) {
            const json& c = j.at("clearColor");
            if (!c.is_array() || (c.size() != 3 && c.size() != 4)) {
                throw ConfigError("clearColor must be [r, g, b] or [r, g, b, a]");
            }
            config.clearColor = Color(c[0].get<float>(), c[1].get<float>(), c[2].get<float>(),
                                      c.size() == 4 ? c[3].get<float>() : 1.0f);
        }

        if (j.contains("runtime")) {
            const json& runtime = j.at("runtime");
            if (runtime.contains("type")) {
                std::string type = runtime.at("type").get<std::string>();
                auto kind = parseRuntimeKind(type);
                if (!kind) {
                    throw ConfigError("unknown runtime type '" + type + "'");
                }
                config.runtime = *kind;
            }
            config.scriptPath = runtime.value("script", config.scriptPath);
            config.port = runtime.value("port", config.port);
            config.linesPerTick = runtime.value("linesPerTick", config.linesPerTick);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config value has the wrong type: ") + e.what());
    }
}

void loadConfigFile(AppConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }

    applyConfigJson(config, j);
}

} // namespace glint
