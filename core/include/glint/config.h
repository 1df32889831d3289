#pragma once

/**
 * @file config.h
 * @brief Application settings from an optional JSON file
 *
 * Example file:
 * @code{.json}
 * {
 *   "window": { "width": 1280, "height": 720, "title": "Glint" },
 *   "blur": true,
 *   "vsync": true,
 *   "clearColor": [0.1, 0.2, 0.3, 1.0],
 *   "runtime": { "type": "websocket", "port": 9877 }
 * }
 * @endcode
 *
 * Every key is optional. Command line flags are applied on top (see cli.h).
 */

#include <glint/color.h>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace glint {

/// Invalid configuration or a violated size precondition
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Where event lines come from
enum class RuntimeKind {
    Script,     ///< Replay a file
    Stdin,      ///< Lines piped into stdin
    WebSocket,  ///< Runtime connects as a WebSocket client
};

std::optional<RuntimeKind> parseRuntimeKind(const std::string& name);

struct AppConfig {
    int windowWidth = 1280;
    int windowHeight = 720;
    std::string windowTitle = "Glint";

    bool blur = false;
    bool vsync = true;
    bool headless = false;   ///< Run the CPU tick only, no window or GPU
    Color clearColor{0.1f, 0.2f, 0.3f, 1.0f};

    RuntimeKind runtime = RuntimeKind::Script;
    std::string scriptPath;
    int port = 9877;
    int linesPerTick = 0;    ///< Script lines released per frame, 0 = all
    int maxFrames = 0;       ///< Stop after this many frames, 0 = run until closed

    /// @throw ConfigError on the first invalid value
    void validate() const;
};

/**
 * @brief Overlay the keys present in a JSON object onto config
 * @throw ConfigError on a wrong type or unknown runtime type
 */
void applyConfigJson(AppConfig& config, const nlohmann::json& j);

/**
 * @brief Read and apply a JSON config file
 * @throw ConfigError if the file is unreadable or not valid JSON
 */
void loadConfigFile(AppConfig& config, const std::string& path);

} // namespace glint
