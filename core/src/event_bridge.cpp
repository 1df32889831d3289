// Glint - Event Bridge

#include <glint/event_bridge.h>
#include <glint/runtime_link.h>
#include <iostream>

namespace glint {

std::string encodeOutbound(const OutboundEvent& event) {
    return "[Event] " + event.drawableId + " " + event.eventName;
}

void EventBridge::pushLine(const std::string& line) {
    DecodeResult result = m_decoder.decode(line);
    if (result.event) {
        m_pending.push_back(std::move(*result.event));
    }
}

void EventBridge::pump() {
    if (!m_link) return;

    m_lineBuffer.clear();
    m_link->poll(m_lineBuffer);
    for (const auto& line : m_lineBuffer) {
        pushLine(line);
    }
}

std::vector<Event> EventBridge::drain() {
    std::vector<Event> events;
    events.reserve(m_pending.size());
    while (!m_pending.empty()) {
        events.push_back(std::move(m_pending.front()));
        m_pending.pop_front();
    }
    return events;
}

void EventBridge::emit(const OutboundEvent& event) {
    std::string line = encodeOutbound(event);
    if (!m_link) {
        std::cerr << "[EventBridge] No runtime attached, dropping " << line << "\n";
        return;
    }
    m_link->send(line);
}

} // namespace glint
