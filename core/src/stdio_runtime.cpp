// Glint - Stdio runtime link

#include <glint/stdio_runtime.h>
#include <iostream>
#include <mutex>
#include <thread>

namespace glint {

// Outlives the StdioRuntime if the reader thread is still blocked in getline
struct StdioRuntime::Shared {
    std::mutex mutex;
    std::vector<std::string> lines;
    bool closed = false;
};

StdioRuntime::StdioRuntime() : m_shared(std::make_shared<Shared>()) {
    std::shared_ptr<Shared> shared = m_shared;
    std::thread reader([shared]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->lines.push_back(std::move(line));
            line.clear();
        }
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->closed = true;
    });
    // std::getline cannot be interrupted, so the thread is never joined
    reader.detach();

    std::cout << "[StdioRuntime] Reading runtime output from stdin\n";
}

StdioRuntime::~StdioRuntime() = default;

void StdioRuntime::poll(std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(m_shared->mutex);
    for (auto& line : m_shared->lines) {
        lines.push_back(std::move(line));
    }
    m_shared->lines.clear();
}

void StdioRuntime::send(const std::string& line) {
    std::cout << line << std::endl;
}

bool StdioRuntime::closed() const {
    std::lock_guard<std::mutex> lock(m_shared->mutex);
    return m_shared->closed;
}

} // namespace glint
