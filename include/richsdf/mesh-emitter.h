#pragma once

#include <richsdf/glyph-atlas.h>
#include <richsdf/shaping.h>
#include <richsdf/style.h>
#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace richsdf {

//-----------------------------------------------------------------------------
// TextVertex - one quad corner
//-----------------------------------------------------------------------------
struct TextVertex {
    glm::vec3 position;     // World units, Y up
    glm::vec2 uv;           // Into the submesh's atlas page, v = 0 at the top row
    glm::vec2 uvB;          // Per TextStyling::uvB
    glm::vec4 color;        // Linear RGBA
};

// Range of the index buffer drawn with one atlas page bound
struct TextSubmesh {
    uint32_t page = 0;
    uint32_t firstIndex = 0;
    uint32_t indexCount = 0;
};

struct TextMesh {
    std::vector<TextVertex> vertices;       // 4 per quad, by layer then glyph order
    std::vector<uint32_t> indices;          // 6 per quad, grouped by page
    std::vector<TextSubmesh> submeshes;
    glm::vec2 dimension = {0.0f, 0.0f};     // Bounding box size, world units

    size_t quadCount() const { return vertices.size() / 4; }
    bool empty() const { return vertices.empty(); }
};

// Atlas entries of one glyph, one per layer; empty when the layer is not drawn
struct GlyphLocations {
    AtlasLocation fill;
    AtlasLocation stroke;                   // Outline ring behind the fill
    AtlasLocation underline;                // Line square, see UNDERLINE_GLYPH
    AtlasLocation underlineStroke;
    AtlasLocation strikethrough;
    AtlasLocation strikethroughStroke;
};

//=============================================================================
// MeshEmitter - positioned glyphs + atlas locations to a quad mesh
//
// Corners per quad: (min,min) (max,min) (min,max) (max,max), indices
// i, i+1, i+2, i+1, i+3, i+2 which is counter-clockwise with Y up.
// Glyphs whose location is empty produce no quad.
//
// Layers are emitted back to front: strokes, stroke underlines, fills,
// underlines, stroke strikethroughs, strikethroughs. Each layer keeps glyph
// order. A decoration is split per glyph and joins its neighbors halfway
// between them; the ends of a run get the rounded halves of the line square.
// uv_b index metas count drawn glyphs, so every layer of a glyph shares them.
//=============================================================================
class MeshEmitter {
public:
    // locations[i] belongs to shaped.glyphs[i]
    static TextMesh emit(const ShapedText& shaped,
                         const std::vector<GlyphLocations>& locations,
                         uint32_t pageSize,
                         const TextStyling& styling);

    static TextMesh emit(const ShapedText& shaped,
                         const std::vector<GlyphLocations>& locations,
                         const GlyphAtlas& atlas,
                         const TextStyling& styling);

    // Fill layer only
    static TextMesh emit(const ShapedText& shaped,
                         const std::vector<AtlasLocation>& locations,
                         uint32_t pageSize,
                         const TextStyling& styling);

    static TextMesh emit(const ShapedText& shaped,
                         const std::vector<AtlasLocation>& locations,
                         const GlyphAtlas& atlas,
                         const TextStyling& styling);
};

} // namespace richsdf
