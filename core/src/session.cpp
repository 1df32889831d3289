// Glint - Session tick

#include <glint/session.h>
#include <glint/runtime_link.h>
#include <iostream>

namespace glint {

Session::Session(glm::vec2 screenSize)
    : m_uniforms(screenSize)
{
}

FrameState Session::tick(double dt, glm::vec2 screenSize) {
    RuntimeLink* link = m_bridge.link();
    if (link && link->consumeRestart()) {
        std::cout << "[Session] Runtime '" << link->name() << "' restarted, clearing scene\n";
        reset();
    }

    m_bridge.pump();
    std::vector<Event> events = m_bridge.drain();

    FrameState frame;

    // Reactions fired by last frame's input go first
    std::vector<AnimateEvent> reactions;
    reactions.swap(m_pendingReactions);
    for (auto& reaction : reactions) {
        m_store.apply(Event{std::move(reaction)});
    }

    for (const auto& event : events) {
        m_store.apply(event);
    }
    frame.eventsApplied = reactions.size() + events.size();

    m_store.advance(dt);
    m_uniforms.update(screenSize, dt);

    frame.drawables = m_store.snapshot();
    frame.uniforms = m_uniforms.block();
    m_compositor.rebuild(frame.drawables, m_store, m_uniforms.screenSize());

    ++m_frameCount;
    return frame;
}

void Session::dispatchInput() {
    m_compositor.dispatch(m_bridge, m_pendingReactions);
}

void Session::reset() {
    m_store.reset();
    m_bridge.decoder().resetIds();
    m_compositor.reset();
    m_pendingReactions.clear();
}

} // namespace glint
