// Glint - WebSocket runtime link

#include <glint/websocket_runtime.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace glint {

class WebSocketRuntime::Impl {
public:
    ix::WebSocketServer server;
    mutable std::mutex mutex;       // guards lines and restarted
    std::vector<std::string> lines;
    bool restarted = false;

    explicit Impl(int port) : server(port, "0.0.0.0") {}

    void receive(const std::string& text) {
        // Control messages are JSON objects; everything else is event text
        if (!text.empty() && text.front() == '{') {
            try {
                json j = json::parse(text);
                if (j.value("type", "") == "restart") {
                    std::cout << "[WebSocketRuntime] Restart requested\n";
                    std::lock_guard<std::mutex> lock(mutex);
                    restarted = true;
                    lines.clear();
                    return;
                }
            } catch (const json::exception& e) {
                std::cerr << "[WebSocketRuntime] JSON parse error: " << e.what() << "\n";
                return;
            }
        }

        std::istringstream in(text);
        std::string line;
        std::lock_guard<std::mutex> lock(mutex);
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }
    }
};

WebSocketRuntime::WebSocketRuntime() = default;

WebSocketRuntime::~WebSocketRuntime() {
    stop();
}

bool WebSocketRuntime::start(int port) {
    if (m_running) return true;

    m_port = port;
    m_impl = std::make_unique<Impl>(port);
    Impl* impl = m_impl.get();

    m_impl->server.setOnClientMessageCallback(
        [impl](std::shared_ptr<ix::ConnectionState> state,
               ix::WebSocket& ws,
               const ix::WebSocketMessagePtr& msg) {
            (void)ws;

            if (msg->type == ix::WebSocketMessageType::Open) {
                std::cout << "[WebSocketRuntime] Runtime connected from " << state->getRemoteIp() << "\n";
                std::lock_guard<std::mutex> lock(impl->mutex);
                impl->restarted = true;
                impl->lines.clear();
            }
            else if (msg->type == ix::WebSocketMessageType::Close) {
                std::cout << "[WebSocketRuntime] Runtime disconnected\n";
            }
            else if (msg->type == ix::WebSocketMessageType::Message) {
                impl->receive(msg->str);
            }
            else if (msg->type == ix::WebSocketMessageType::Error) {
                std::cerr << "[WebSocketRuntime] Error: " << msg->errorInfo.reason << "\n";
            }
        }
    );

    auto res = m_impl->server.listen();
    if (!res.first) {
        std::cerr << "[WebSocketRuntime] Failed to start on port " << port << ": " << res.second << "\n";
        m_impl.reset();
        return false;
    }

    m_impl->server.start();
    m_running = true;
    std::cout << "[WebSocketRuntime] Listening on port " << port << "\n";
    return true;
}

void WebSocketRuntime::stop() {
    if (!m_running) return;

    m_impl->server.stop();
    m_running = false;
    std::cout << "[WebSocketRuntime] Stopped\n";
}

size_t WebSocketRuntime::clientCount() const {
    if (!m_impl) return 0;
    return m_impl->server.getClients().size();
}

void WebSocketRuntime::poll(std::vector<std::string>& lines) {
    if (!m_impl) return;
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    for (auto& line : m_impl->lines) {
        lines.push_back(std::move(line));
    }
    m_impl->lines.clear();
}

void WebSocketRuntime::send(const std::string& line) {
    if (!m_running || !m_impl) return;

    // Broadcast to all clients
    for (auto& client : m_impl->server.getClients()) {
        client->send(line);
    }
}

bool WebSocketRuntime::consumeRestart() {
    if (!m_impl) return false;
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    bool restarted = m_impl->restarted;
    m_impl->restarted = false;
    return restarted;
}

} // namespace glint
