#pragma once

/**
 * @file event_bridge.h
 * @brief Inbound event queue and outbound event channel
 *
 * Lines from the runtime link are decoded as they arrive and queued in
 * arrival order. The frame loop drains the queue exactly once per tick;
 * anything that arrives later waits for the next drain.
 */

#include <glint/event.h>
#include <glint/event_decoder.h>
#include <deque>
#include <string>
#include <vector>

namespace glint {

class RuntimeLink;

class EventBridge {
public:
    explicit EventBridge(RuntimeLink* link = nullptr) : m_link(link) {}

    /// Non-owning; nullptr disconnects
    void setLink(RuntimeLink* link) { m_link = link; }
    RuntimeLink* link() const { return m_link; }

    /// Decode one line and queue the result (blank and rejected lines queue nothing)
    void pushLine(const std::string& line);

    /// Poll the link and decode everything it delivered
    void pump();

    /// Hand over every queued event, oldest first, and empty the queue
    std::vector<Event> drain();

    /// Send an input event back to the runtime
    void emit(const OutboundEvent& event);

    size_t pendingCount() const { return m_pending.size(); }
    size_t droppedCount() const { return m_decoder.failureCount(); }

    EventDecoder& decoder() { return m_decoder; }

private:
    RuntimeLink* m_link = nullptr;
    EventDecoder m_decoder;
    std::deque<Event> m_pending;
    std::vector<std::string> m_lineBuffer;
};

} // namespace glint
