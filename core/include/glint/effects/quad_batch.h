#pragma once

/**
 * @file quad_batch.h
 * @brief Scene snapshot -> vertex/index arrays for the effect pipeline
 *
 * Every quad is 4 vertices (top-left, top-right, bottom-right, bottom-left)
 * and 6 indices. Quads are emitted in snapshot order; a drawable's shadow
 * layers come directly before it so they end up underneath.
 *
 * Text and number drawables produce no quads. Their content is drawn by the
 * display's bitmap font in the overlay.
 *
 * Consecutive quads sampling the same image share one DrawRange, so the
 * pipeline switches textures only where the image changes. Shadows and
 * plain quads use the empty image (the white texture).
 */

#include <glint/drawable.h>
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace glint::effects {

/// Vertex layout shared with the WGSL `VertexInput` struct
struct QuadVertex {
    glm::vec2 position;     ///< @location(0), pixels
    glm::vec4 color;        ///< @location(1)
    glm::vec2 uv;           ///< @location(2)
    uint32_t effectFlags;   ///< @location(3), flat
};

static_assert(sizeof(QuadVertex) == 36, "QuadVertex stride must be 36 bytes");
static_assert(offsetof(QuadVertex, color) == 8, "color must be at offset 8");
static_assert(offsetof(QuadVertex, uv) == 24, "uv must be at offset 24");
static_assert(offsetof(QuadVertex, effectFlags) == 32, "effectFlags must be at offset 32");

/// Indices drawn with one texture binding
struct DrawRange {
    std::string image;          ///< Empty = white texture
    uint32_t firstIndex = 0;
    uint32_t indexCount = 0;
};

/// Near shadow layer opacity
inline constexpr float SHADOW_ALPHA = 0.1f;
/// Extra layer opacity for deep shadows
inline constexpr float DEEP_SHADOW_ALPHA = 0.05f;
/// Extra offset of the deep shadow layer, pixels
inline constexpr float DEEP_SHADOW_SPREAD = 2.0f;

class QuadBatch {
public:
    /// Replace the batch contents with the quads for a snapshot
    void build(const std::vector<Drawable>& drawables);

    void clear();

    /// Append one quad; rect is (x, y, w, h) in pixels
    void addQuad(const glm::vec4& rect, const Color& color, const UvRect& uv, EffectFlags flags,
                 const std::string& image = std::string());

    const std::vector<QuadVertex>& vertices() const { return m_vertices; }
    const std::vector<uint32_t>& indices() const { return m_indices; }
    const std::vector<DrawRange>& ranges() const { return m_ranges; }
    size_t quadCount() const { return m_vertices.size() / 4; }
    bool empty() const { return m_vertices.empty(); }

    static bool producesQuad(const Drawable& drawable);

private:
    void addShadow(const Drawable& drawable, const glm::vec4& rect);

    std::vector<QuadVertex> m_vertices;
    std::vector<uint32_t> m_indices;
    std::vector<DrawRange> m_ranges;
};

} // namespace glint::effects
