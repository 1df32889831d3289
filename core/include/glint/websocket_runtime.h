#pragma once

/**
 * @file websocket_runtime.h
 * @brief RuntimeLink where the runtime connects as a WebSocket client
 *
 * Each text message may carry several newline-separated event lines.
 * A message of the form {"type":"restart"}, or a new client connecting,
 * marks the runtime as restarted. Outbound events are broadcast to every
 * connected client.
 */

#include <glint/runtime_link.h>
#include <memory>
#include <string>
#include <vector>

namespace glint {

class WebSocketRuntime : public RuntimeLink {
public:
    WebSocketRuntime();
    ~WebSocketRuntime() override;

    /// @return false if the port could not be bound
    bool start(int port);
    void stop();
    bool isRunning() const { return m_running; }

    size_t clientCount() const;

    void poll(std::vector<std::string>& lines) override;
    void send(const std::string& line) override;
    std::string name() const override { return "websocket"; }
    bool consumeRestart() override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
    bool m_running = false;
    int m_port = 0;
};

} // namespace glint
