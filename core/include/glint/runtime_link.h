#pragma once

/**
 * @file runtime_link.h
 * @brief Transport between glint and the external scripting runtime
 *
 * The pipeline only ever sees decoded events; where the text lines come
 * from is hidden behind this interface. Implementations:
 * - ScriptRuntime: replays a fixed script (also the test double)
 * - StdioRuntime: line-buffered stdin/stdout of a piped runtime
 * - WebSocketRuntime: runtime connects as a WebSocket client
 *
 * poll() and send() are called from the frame loop only.
 */

#include <string>
#include <vector>

namespace glint {

class RuntimeLink {
public:
    virtual ~RuntimeLink() = default;

    /// Append every line received since the last poll, in arrival order
    virtual void poll(std::vector<std::string>& lines) = 0;

    /// Deliver one outbound line to the runtime
    virtual void send(const std::string& line) = 0;

    virtual std::string name() const = 0;

    /// True once after the runtime restarted (scene should be reset)
    virtual bool consumeRestart() { return false; }
};

} // namespace glint
