// Glint - Compositor / Hit-Tester

#include <glint/compositor.h>
#include <glint/event_bridge.h>
#include <glint/effects/effect_math.h>

namespace glint {

namespace math = effects::math;

namespace {

// The font draws one glyph per UTF-8 sequence; continuation bytes add none
bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t glyphCount(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (!isContinuation(c)) ++count;
    }
    return count;
}

// Leading part of text holding at most n glyphs, never splitting a sequence
std::string firstGlyphs(const std::string& text, size_t n) {
    size_t glyphs = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isContinuation(text[i])) continue;
        if (glyphs == n) return text.substr(0, i);
        ++glyphs;
    }
    return text;
}

} // namespace

const HandlerBinding* OverlayElement::binding(const std::string& eventName) const {
    for (const auto& b : bindings) {
        if (b.eventName == eventName) return &b;
    }
    return nullptr;
}

bool OverlayElement::containsNdc(glm::vec2 ndc) const {
    return ndc.x >= ndcRect.x && ndc.x <= ndcRect.z &&
           ndc.y <= ndcRect.y && ndc.y >= ndcRect.w;
}

void Compositor::rebuild(const std::vector<Drawable>& snapshot, const SceneStore& store,
                         glm::vec2 screenSize) {
    m_screenSize = screenSize;
    m_elements.clear();

    for (const auto& d : snapshot) {
        const auto* bindings = store.handlers(d.id);
        bool textLike = d.kind == DrawableKind::Text || d.kind == DrawableKind::Number;
        if (d.kind != DrawableKind::Card && !textLike && !bindings) {
            continue;
        }

        OverlayElement element;
        element.id = d.id;
        element.kind = d.kind;
        element.rect = d.bounds();
        glm::vec2 topLeft = math::projectToNdc(glm::vec2(element.rect.x, element.rect.y), screenSize);
        glm::vec2 bottomRight = math::projectToNdc(
            glm::vec2(element.rect.x + element.rect.z, element.rect.y + element.rect.w), screenSize);
        element.ndcRect = glm::vec4(topLeft.x, topLeft.y, bottomRight.x, bottomRight.y);
        element.label = d.label;
        // Card labels sit on the colored quad; text is drawn in its own color
        element.labelColor = textLike ? d.color : Color::White;
        if (bindings) {
            element.bindings = *bindings;
        }
        m_elements.push_back(std::move(element));
    }
}

const OverlayElement* Compositor::find(const std::string& id) const {
    for (const auto& e : m_elements) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

std::vector<OverlayLabel> Compositor::labels() const {
    std::vector<OverlayLabel> result;
    for (const auto& e : m_elements) {
        if (e.label.empty()) continue;

        float inset = e.kind == DrawableKind::Card ? LABEL_PADDING : 0.0f;
        float glyph = GLYPH_SIZE * LABEL_SCALE;
        float width = e.rect.z - 2.0f * inset;
        float height = e.rect.w - 2.0f * inset;
        if (width < glyph || height < glyph) continue;

        size_t fit = static_cast<size_t>(width / glyph);
        OverlayLabel label;
        label.text = e.label;
        if (glyphCount(label.text) > fit) {
            label.text = fit > 3 ? firstGlyphs(label.text, fit - 3) + "..." : firstGlyphs(label.text, fit);
        }
        label.position = glm::vec2(e.rect.x + inset, e.rect.y + inset);
        label.scale = LABEL_SCALE;
        label.color = e.labelColor;
        result.push_back(std::move(label));
    }
    return result;
}

const OverlayElement* Compositor::hitTest(glm::vec2 pixel) const {
    glm::vec2 ndc = math::projectToNdc(pixel, m_screenSize);
    for (auto it = m_elements.rbegin(); it != m_elements.rend(); ++it) {
        if (it->containsNdc(ndc)) return &*it;
    }
    return nullptr;
}

void Compositor::dispatch(EventBridge& bridge, std::vector<AnimateEvent>& reactions) {
    for (const auto& input : m_input) {
        const OverlayElement* hit = hitTest(input.position);

        if (input.type == PointerInput::Type::Press) {
            if (hit && hit->binding("click")) {
                fire(*hit, "click", bridge, reactions);
            }
            continue;
        }

        std::string hitId = hit ? hit->id : std::string();
        if (hitId == m_hovered) continue;
        m_hovered = hitId;
        if (hit && hit->binding("hover")) {
            fire(*hit, "hover", bridge, reactions);
        }
    }
    m_input.clear();
}

void Compositor::fire(const OverlayElement& element, const std::string& eventName,
                      EventBridge& bridge, std::vector<AnimateEvent>& reactions) {
    bridge.emit(OutboundEvent{element.id, eventName});
    const HandlerBinding* b = element.binding(eventName);
    if (b) {
        reactions.insert(reactions.end(), b->reactions.begin(), b->reactions.end());
    }
}

void Compositor::reset() {
    m_elements.clear();
    m_input.clear();
    m_hovered.clear();
}

} // namespace glint
