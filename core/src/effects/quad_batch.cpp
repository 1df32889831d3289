// Glint Effects - Quad batch

#include <glint/effects/quad_batch.h>
#include <glint/tween.h>

namespace glint::effects {

bool QuadBatch::producesQuad(const Drawable& drawable) {
    if (drawable.kind == DrawableKind::Text || drawable.kind == DrawableKind::Number) {
        return false;
    }
    return drawable.size.x > 0.0f && drawable.size.y > 0.0f;
}

void QuadBatch::clear() {
    m_vertices.clear();
    m_indices.clear();
    m_ranges.clear();
}

void QuadBatch::build(const std::vector<Drawable>& drawables) {
    clear();
    for (const auto& d : drawables) {
        if (!producesQuad(d)) continue;

        glm::vec4 rect = d.bounds();
        if (d.shadow > 0.0f) {
            addShadow(d, rect);
        }
        addQuad(rect, d.color, d.uv, d.effects, d.image);
    }
}

void QuadBatch::addShadow(const Drawable& drawable, const glm::vec4& rect) {
    // Shadows follow the quad when it shakes; other effects stay on the quad
    EffectFlags flags = drawable.effects & EffectFlags::Shake;
    float offset = drawable.shadow * 0.5f;

    if (drawable.shadow > DEEP_SHADOW_DEPTH) {
        float far = offset + DEEP_SHADOW_SPREAD;
        addQuad(glm::vec4(rect.x + far, rect.y + far, rect.z, rect.w),
                Color::Black.withAlpha(DEEP_SHADOW_ALPHA), UvRect{}, flags);
    }
    addQuad(glm::vec4(rect.x + offset, rect.y + offset, rect.z, rect.w),
            Color::Black.withAlpha(SHADOW_ALPHA), UvRect{}, flags);
}

void QuadBatch::addQuad(const glm::vec4& rect, const Color& color, const UvRect& uv,
                        EffectFlags flags, const std::string& image) {
    uint32_t base = static_cast<uint32_t>(m_vertices.size());
    uint32_t bits = static_cast<uint32_t>(flags) & EFFECT_FLAGS_MASK;
    glm::vec4 c = color.toVec4();

    float x0 = rect.x;
    float y0 = rect.y;
    float x1 = rect.x + rect.z;
    float y1 = rect.y + rect.w;

    m_vertices.push_back({glm::vec2(x0, y0), c, glm::vec2(uv.u0, uv.v0), bits});
    m_vertices.push_back({glm::vec2(x1, y0), c, glm::vec2(uv.u1, uv.v0), bits});
    m_vertices.push_back({glm::vec2(x1, y1), c, glm::vec2(uv.u1, uv.v1), bits});
    m_vertices.push_back({glm::vec2(x0, y1), c, glm::vec2(uv.u0, uv.v1), bits});

    if (m_ranges.empty() || m_ranges.back().image != image) {
        m_ranges.push_back({image, static_cast<uint32_t>(m_indices.size()), 0});
    }
    m_ranges.back().indexCount += 6;

    for (uint32_t i : {0u, 1u, 2u, 0u, 2u, 3u}) {
        m_indices.push_back(base + i);
    }
}

} // namespace glint::effects
