#pragma once

/**
 * @file stdio_runtime.h
 * @brief RuntimeLink over this process's stdin/stdout
 *
 * Used when the runtime pipes its output into glint:
 * @code
 * my-runtime | glint --stdin
 * @endcode
 * A reader thread blocks on stdin and queues raw lines; decoding happens
 * on the frame loop. Outbound events are written to stdout, one per line.
 */

#include <glint/runtime_link.h>
#include <memory>
#include <string>
#include <vector>

namespace glint {

class StdioRuntime : public RuntimeLink {
public:
    StdioRuntime();
    ~StdioRuntime() override;

    void poll(std::vector<std::string>& lines) override;
    void send(const std::string& line) override;
    std::string name() const override { return "stdin"; }

    /// True once stdin reached end of file
    bool closed() const;

private:
    struct Shared;
    std::shared_ptr<Shared> m_shared;
};

} // namespace glint
