// Glint - Stack layout

#include <glint/stack_layout.h>

namespace glint {

glm::vec2 StackLayout::defaultSize(DrawableKind kind) {
    switch (kind) {
        case DrawableKind::Text:
        case DrawableKind::Number:
            return glm::vec2(COLUMN_WIDTH, TEXT_HEIGHT);
        case DrawableKind::Card:
        case DrawableKind::Quad:
            break;
    }
    return glm::vec2(COLUMN_WIDTH, CARD_HEIGHT);
}

glm::vec2 StackLayout::place(DrawableKind kind) {
    glm::vec2 slot(ORIGIN_X, m_cursorY);
    bool textLike = kind == DrawableKind::Text || kind == DrawableKind::Number;
    m_cursorY += textLike ? TEXT_ADVANCE : CARD_ADVANCE;
    return slot;
}

} // namespace glint
