#pragma once

/**
 * @file compositor.h
 * @brief Interactive overlay over the rendered raster
 *
 * The overlay holds one element per card, text drawable, and drawable with
 * an input binding, keyed by drawable id. Element rects are projected with
 * the same pixel-to-NDC transform the vertex shader uses, and hit testing
 * is done in NDC so a hit lands exactly where the quad was drawn.
 *
 * Pointer input is queued while the frame is built and dispatched after
 * present. Only the topmost element under the pointer receives it.
 */

#include <glint/drawable.h>
#include <glint/event.h>
#include <glint/scene_store.h>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace glint {

class EventBridge;

struct OverlayElement {
    std::string id;
    DrawableKind kind = DrawableKind::Quad;
    glm::vec4 rect{0.0f};       ///< Pixels (x, y, w, h) after scale
    glm::vec4 ndcRect{0.0f};    ///< NDC (left, top, right, bottom); top > bottom
    std::string label;          ///< Drawn with the bitmap font, may be empty
    Color labelColor = Color::White;
    std::vector<HandlerBinding> bindings;

    const HandlerBinding* binding(const std::string& eventName) const;
    bool containsNdc(glm::vec2 ndc) const;
};

/// A label placed for the bitmap font, in pixels
struct OverlayLabel {
    std::string text;
    glm::vec2 position{0.0f};   ///< Top-left of the first glyph
    float scale = 1.0f;         ///< Glyph size is 8 * scale pixels
    Color color = Color::White;
};

struct PointerInput {
    enum class Type { Press, Move };
    Type type = Type::Move;
    glm::vec2 position{0.0f};   ///< Pixels, origin top-left
};

class Compositor {
public:
    /// Rebuild the overlay from this frame's snapshot
    void rebuild(const std::vector<Drawable>& snapshot, const SceneStore& store,
                 glm::vec2 screenSize);

    const std::vector<OverlayElement>& elements() const { return m_elements; }
    const OverlayElement* find(const std::string& id) const;

    /**
     * @brief Place every element label inside its rect
     *
     * Card labels are inset by LABEL_PADDING; text labels start at the
     * rect origin. Labels wider than the rect are cut with "..." and
     * labels of rects too small for one glyph are skipped.
     */
    std::vector<OverlayLabel> labels() const;

    static constexpr float LABEL_SCALE = 2.0f;
    static constexpr float LABEL_PADDING = 8.0f;
    static constexpr float GLYPH_SIZE = 8.0f;

    /// Topmost element under a pixel position, nullptr if none
    const OverlayElement* hitTest(glm::vec2 pixel) const;

    void queuePress(glm::vec2 pixel) { m_input.push_back({PointerInput::Type::Press, pixel}); }
    void queueMove(glm::vec2 pixel) { m_input.push_back({PointerInput::Type::Move, pixel}); }
    size_t pendingInput() const { return m_input.size(); }

    /**
     * @brief Dispatch queued input against the current overlay
     *
     * Fired bindings send their OutboundEvent through the bridge and append
     * their reactions to @p reactions for the next tick.
     */
    void dispatch(EventBridge& bridge, std::vector<AnimateEvent>& reactions);

    /// Drop elements, queued input and hover state
    void reset();

    const std::string& hoveredId() const { return m_hovered; }

private:
    void fire(const OverlayElement& element, const std::string& eventName,
              EventBridge& bridge, std::vector<AnimateEvent>& reactions);

    std::vector<OverlayElement> m_elements;  // draw order
    std::vector<PointerInput> m_input;
    glm::vec2 m_screenSize{1.0f, 1.0f};
    std::string m_hovered;
};

} // namespace glint
