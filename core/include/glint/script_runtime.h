#pragma once

/**
 * @file script_runtime.h
 * @brief RuntimeLink that replays a recorded event script
 *
 * Lines are released either all at once or a fixed number per poll, which
 * lets a script play back as an animation. Outbound lines are recorded
 * instead of delivered anywhere.
 */

#include <glint/runtime_link.h>
#include <memory>
#include <string>
#include <vector>

namespace glint {

class ScriptRuntime : public RuntimeLink {
public:
    ScriptRuntime() = default;

    /// @param linesPerTick Lines released per poll, 0 = everything at once
    explicit ScriptRuntime(std::vector<std::string> lines, int linesPerTick = 0);

    /// @throw ConfigError if the file cannot be read
    static std::unique_ptr<ScriptRuntime> fromFile(const std::string& path, int linesPerTick = 0);

    /// Start the script over and report a restart
    void rewind();

    void poll(std::vector<std::string>& lines) override;
    void send(const std::string& line) override;
    std::string name() const override { return "script"; }
    bool consumeRestart() override;

    bool exhausted() const { return m_cursor >= m_lines.size(); }
    const std::vector<std::string>& sent() const { return m_sent; }

private:
    std::vector<std::string> m_lines;
    size_t m_cursor = 0;
    int m_linesPerTick = 0;
    std::vector<std::string> m_sent;
    bool m_restarted = false;
};

} // namespace glint
