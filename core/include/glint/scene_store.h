#pragma once

/**
 * @file scene_store.h
 * @brief Authoritative scene state: drawables, live tweens, input bindings
 *
 * Events are applied between ticks; advance() moves the store clock and
 * writes every live tween into its drawable. Readers take snapshot(), which
 * copies the resolved drawables in draw order, so a render never sees a
 * half-applied tick.
 *
 * A redraw of an existing id keeps its layout slot and the last value every
 * tween wrote, so finished animations stay frozen at their destination.
 *
 * Drawables live until reset(). Animate and RegisterHandler events naming an
 * id that was never drawn are logged and ignored.
 */

#include <glint/drawable.h>
#include <glint/event.h>
#include <glint/stack_layout.h>
#include <glint/tween.h>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace glint {

/// One input hook on a drawable
struct HandlerBinding {
    std::string eventName;
    std::vector<AnimateEvent> reactions;  ///< Applied locally when the hook fires
};

class SceneStore {
public:
    void apply(const Event& event);

    /// Advance the clock by dt seconds (negative dt counts as 0) and resolve tweens
    void advance(double dt);

    std::vector<Drawable> snapshot() const { return m_drawables; }

    /// Remove every drawable, tween and binding; the clock keeps running
    void reset();

    double now() const { return m_now; }

    const Drawable* find(const std::string& id) const;
    size_t drawableCount() const { return m_drawables.size(); }

    size_t activeTweenCount() const { return m_tweens.size(); }
    const Tween* findTween(const std::string& id, TweenProperty property) const;

    /// All bindings of a drawable, nullptr if it has none
    const std::vector<HandlerBinding>* handlers(const std::string& id) const;
    const HandlerBinding* handlerFor(const std::string& id, const std::string& eventName) const;

private:
    void applyDraw(const DrawEvent& event);
    void applyAnimate(const AnimateEvent& event);
    void applyRegister(const RegisterHandlerEvent& event);

    Drawable* findMutable(const std::string& id);

    using TweenKey = std::pair<std::string, TweenProperty>;

    std::vector<Drawable> m_drawables;                  // draw order
    std::unordered_map<std::string, size_t> m_index;    // id -> m_drawables slot
    std::map<TweenKey, Tween> m_tweens;
    std::map<TweenKey, PropertyValue> m_overrides;      // last animated value, survives redraws
    std::unordered_map<std::string, std::vector<HandlerBinding>> m_handlers;
    StackLayout m_layout;
    double m_now = 0.0;
};

} // namespace glint
