// Glint - Script runtime
// Replays recorded runtime output, optionally a few lines per frame

#include <glint/script_runtime.h>
#include <glint/config.h>
#include <algorithm>
#include <fstream>
#include <iostream>

namespace glint {

ScriptRuntime::ScriptRuntime(std::vector<std::string> lines, int linesPerTick)
    : m_lines(std::move(lines)), m_linesPerTick(linesPerTick < 0 ? 0 : linesPerTick) {}

std::unique_ptr<ScriptRuntime> ScriptRuntime::fromFile(const std::string& path, int linesPerTick) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open script: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // '#' lines are comments in hand-written scripts
        if (!line.empty() && line[0] == '#') {
            continue;
        }
        lines.push_back(line);
    }

    std::cout << "[ScriptRuntime] Loaded " << lines.size() << " lines from " << path << "\n";
    return std::make_unique<ScriptRuntime>(std::move(lines), linesPerTick);
}

void ScriptRuntime::rewind() {
    m_cursor = 0;
    m_sent.clear();
    m_restarted = true;
}

void ScriptRuntime::poll(std::vector<std::string>& lines) {
    size_t remaining = m_lines.size() - m_cursor;
    size_t count = m_linesPerTick > 0
        ? std::min(remaining, static_cast<size_t>(m_linesPerTick))
        : remaining;

    for (size_t i = 0; i < count; ++i) {
        lines.push_back(m_lines[m_cursor++]);
    }
}

void ScriptRuntime::send(const std::string& line) {
    m_sent.push_back(line);
}

bool ScriptRuntime::consumeRestart() {
    bool restarted = m_restarted;
    m_restarted = false;
    return restarted;
}

} // namespace glint
