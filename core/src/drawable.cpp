// Glint - Drawable helpers

#include <glint/drawable.h>

namespace glint {

const char* kindName(DrawableKind kind) {
    switch (kind) {
        case DrawableKind::Quad:   return "quad";
        case DrawableKind::Card:   return "card";
        case DrawableKind::Text:   return "text";
        case DrawableKind::Number: return "number";
    }
    return "unknown";
}

glm::vec4 Drawable::bounds() const {
    glm::vec2 center = position + size * 0.5f;
    glm::vec2 scaled = size * scale;
    glm::vec2 topLeft = center - scaled * 0.5f;
    return glm::vec4(topLeft.x, topLeft.y, scaled.x, scaled.y);
}

bool Drawable::contains(glm::vec2 point) const {
    glm::vec4 b = bounds();
    return point.x >= b.x && point.x <= b.x + b.z &&
           point.y >= b.y && point.y <= b.y + b.w;
}

} // namespace glint
