// Glint - Scene State Store

#include <glint/scene_store.h>
#include <algorithm>
#include <iostream>
#include <type_traits>

namespace glint {

void SceneStore::apply(const Event& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DrawEvent>) {
            applyDraw(e);
        } else if constexpr (std::is_same_v<T, AnimateEvent>) {
            applyAnimate(e);
        } else if constexpr (std::is_same_v<T, RegisterHandlerEvent>) {
            applyRegister(e);
        }
        // UnparsedEvent: runtime chatter, nothing to do
    }, event);
}

void SceneStore::applyDraw(const DrawEvent& event) {
    Drawable incoming = event.drawable;
    if (incoming.id.empty()) {
        std::cerr << "[SceneStore] Ignoring drawable without an id\n";
        return;
    }
    incoming.effects = sanitizeFlags(static_cast<uint32_t>(incoming.effects));

    if (Drawable* existing = findMutable(incoming.id)) {
        // Update in place: the layout slot and every animated value carry over
        if (incoming.autoLayout) {
            incoming.position = existing->position;
        }
        *existing = std::move(incoming);
        for (auto it = m_overrides.lower_bound(TweenKey{existing->id, TweenProperty::Color});
             it != m_overrides.end() && it->first.first == existing->id; ++it) {
            writeProperty(*existing, it->second);
        }
        return;
    }

    if (incoming.autoLayout) {
        incoming.position = m_layout.place(incoming.kind);
    }
    m_index[incoming.id] = m_drawables.size();
    m_drawables.push_back(std::move(incoming));
}

void SceneStore::applyAnimate(const AnimateEvent& event) {
    const Drawable* target = find(event.targetId);
    if (!target) {
        std::cerr << "[SceneStore] Animation for unknown drawable '" << event.targetId
                  << "' ignored\n";
        return;
    }

    TweenProperty property = event.property();
    Tween tween(event.targetId, readProperty(*target, property), event.value,
                event.duration, m_now, event.easing);

    // At most one tween per (target, property); the newest wins
    m_tweens.insert_or_assign(TweenKey{event.targetId, property}, std::move(tween));
}

void SceneStore::applyRegister(const RegisterHandlerEvent& event) {
    if (!find(event.targetId)) {
        std::cerr << "[SceneStore] Handler '" << event.eventName << "' for unknown drawable '"
                  << event.targetId << "' ignored\n";
        return;
    }

    auto& bindings = m_handlers[event.targetId];
    auto it = std::find_if(bindings.begin(), bindings.end(), [&](const HandlerBinding& b) {
        return b.eventName == event.eventName;
    });
    if (it != bindings.end()) {
        it->reactions = event.reactions;
    } else {
        bindings.push_back({event.eventName, event.reactions});
    }

    if (event.eventName != "click" && event.eventName != "hover") {
        std::cout << "[SceneStore] Registered '" << event.eventName << "' on '"
                  << event.targetId << "' (no input source fires it)\n";
    }
}

void SceneStore::advance(double dt) {
    m_now += std::max(dt, 0.0);

    for (auto it = m_tweens.begin(); it != m_tweens.end();) {
        const Tween& tween = it->second;
        Drawable* target = findMutable(tween.targetId());
        if (!target) {
            it = m_tweens.erase(it);
            continue;
        }

        PropertyValue value = tween.sample(m_now);
        writeProperty(*target, value);
        m_overrides.insert_or_assign(it->first, std::move(value));
        if (tween.finished(m_now)) {
            it = m_tweens.erase(it);
        } else {
            ++it;
        }
    }
}

void SceneStore::reset() {
    m_drawables.clear();
    m_index.clear();
    m_tweens.clear();
    m_overrides.clear();
    m_handlers.clear();
    m_layout.reset();
}

const Drawable* SceneStore::find(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) return nullptr;
    return &m_drawables[it->second];
}

Drawable* SceneStore::findMutable(const std::string& id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) return nullptr;
    return &m_drawables[it->second];
}

const Tween* SceneStore::findTween(const std::string& id, TweenProperty property) const {
    auto it = m_tweens.find(TweenKey{id, property});
    if (it == m_tweens.end()) return nullptr;
    return &it->second;
}

const std::vector<HandlerBinding>* SceneStore::handlers(const std::string& id) const {
    auto it = m_handlers.find(id);
    if (it == m_handlers.end() || it->second.empty()) return nullptr;
    return &it->second;
}

const HandlerBinding* SceneStore::handlerFor(const std::string& id,
                                             const std::string& eventName) const {
    const auto* bindings = handlers(id);
    if (!bindings) return nullptr;
    for (const auto& binding : *bindings) {
        if (binding.eventName == eventName) return &binding;
    }
    return nullptr;
}

} // namespace glint
