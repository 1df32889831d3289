#pragma once

/**
 * @file stack_layout.h
 * @brief Single-column placement for drawables the runtime did not position
 */

#include <glint/drawable.h>
#include <glm/glm.hpp>

namespace glint {

class StackLayout {
public:
    static constexpr float ORIGIN_X = 20.0f;
    static constexpr float ORIGIN_Y = 30.0f;
    static constexpr float COLUMN_WIDTH = 300.0f;
    static constexpr float CARD_HEIGHT = 60.0f;
    static constexpr float CARD_ADVANCE = 80.0f;
    static constexpr float TEXT_HEIGHT = 24.0f;
    static constexpr float TEXT_ADVANCE = 50.0f;

    /// Size a drawable of this kind gets when the runtime gives none
    static glm::vec2 defaultSize(DrawableKind kind);

    /// Return the next slot for this kind and move the cursor past it
    glm::vec2 place(DrawableKind kind);

    void reset() { m_cursorY = ORIGIN_Y; }

    float cursorY() const { return m_cursorY; }

private:
    float m_cursorY = ORIGIN_Y;
};

} // namespace glint
