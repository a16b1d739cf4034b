#include <richsdf/mesh-emitter.h>
#include <richsdf/color.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>

namespace richsdf {

namespace {

struct Quad {
    size_t glyph;
    float left, right;          // Pixels, layout space
    float x0, x1;               // World
    float bottom, top;          // World, Y up
    float u0, u1, vTop, vBottom;
    uint32_t page;
    glm::vec4 color;            // sRGB
    size_t pass;
};

// Back to front
struct LayerPass {
    AtlasLocation GlyphLocations::* location;
    bool line;
    bool stroke;
};

constexpr LayerPass LAYER_PASSES[] = {
    {&GlyphLocations::stroke, false, true},
    {&GlyphLocations::underlineStroke, true, true},
    {&GlyphLocations::fill, false, false},
    {&GlyphLocations::underline, true, false},
    {&GlyphLocations::strikethroughStroke, true, true},
    {&GlyphLocations::strikethrough, true, false},
};

float uvBComponent(GlyphMeta meta, const TextVertex& vertex, size_t corner,
                   const Quad& quad, const PositionedGlyph& glyph, uint32_t ordinal,
                   uint32_t inkedCount, float lineOffset, float em,
                   const glm::vec2& bbMin, const glm::vec2& dimension) {
    switch (meta) {
    case GlyphMeta::IndexFraction:
        return static_cast<float>(ordinal) / static_cast<float>(inkedCount);
    case GlyphMeta::Index:
        return static_cast<float>(ordinal);
    case GlyphMeta::Advance: {
        const float x = (corner == 0 || corner == 2) ? quad.left : quad.right;
        return (x + lineOffset) / em;
    }
    case GlyphMeta::PerGlyphAdvance:
        return ((quad.left + quad.right) * 0.5f + lineOffset) / em;
    case GlyphMeta::RowX:
        return dimension.x > 0.0f ? (vertex.position.x - bbMin.x) / dimension.x : 0.0f;
    case GlyphMeta::ColY:
        return dimension.y > 0.0f ? (vertex.position.y - bbMin.y) / dimension.y : 0.0f;
    case GlyphMeta::LineProgress:
        return glyph.lineProgress;
    case GlyphMeta::MagicNumber:
        return glyph.magicNumber;
    }
    return 0.0f;
}

class QuadBuilder {
public:
    QuadBuilder(float worldScale, float invPage) : _worldScale(worldScale), _invPage(invPage) {}

    std::vector<Quad> quads;
    glm::vec2 bbMin{std::numeric_limits<float>::max()};
    glm::vec2 bbMax{std::numeric_limits<float>::lowest()};

    // Image at its own size, pen at origin
    void addGlyph(size_t glyph, size_t pass, const PositionedGlyph& g, const AtlasLocation& loc,
                  const glm::vec4& color) {
        const float s = scaleOf(g, loc);
        const float left = g.origin.x + loc.bearingX * s;
        const float right = left + static_cast<float>(loc.rect.width) * s;
        const float topPx = g.origin.y - loc.bearingY * s;
        const float bottomPx = topPx + static_cast<float>(loc.rect.height) * s;
        add(glyph, pass, loc, color, left, right, topPx, bottomPx,
            static_cast<float>(loc.rect.x), static_cast<float>(loc.rect.x + loc.rect.width));
    }

    // Decoration over [min, max]. The line square is cut at its center
    // column: the left half caps the start of a run, the right half its end,
    // and the center column is stretched in between.
    void addLine(size_t glyph, size_t pass, const PositionedGlyph& g, const AtlasLocation& loc,
                 const glm::vec4& color, float min, float max, bool runStart, bool runEnd) {
        const float s = scaleOf(g, loc);
        const float half = static_cast<float>(loc.rect.width) * s * 0.5f;
        const float radius = loc.advance * s * 0.5f;
        const float topPx = g.origin.y - loc.bearingY * s;
        const float bottomPx = topPx + static_cast<float>(loc.rect.height) * s;

        float start = runStart ? min + radius : min;
        float end = runEnd ? max - radius : max;
        if (end < start) {
            start = end = (start + end) * 0.5f;
        }

        const float uLeft = static_cast<float>(loc.rect.x);
        const float uCenter = uLeft + static_cast<float>(loc.rect.width) * 0.5f;
        const float uRight = uLeft + static_cast<float>(loc.rect.width);
        if (runStart) {
            add(glyph, pass, loc, color, start - half, start, topPx, bottomPx, uLeft, uCenter);
        }
        add(glyph, pass, loc, color, start, end, topPx, bottomPx, uCenter, uCenter);
        if (runEnd) {
            add(glyph, pass, loc, color, end, end + half, topPx, bottomPx, uCenter, uRight);
        }
    }

private:
    static float scaleOf(const PositionedGlyph& g, const AtlasLocation& loc) {
        return loc.pixelSize > 0.0f ? g.pixelSize / loc.pixelSize : 1.0f;
    }

    void add(size_t glyph, size_t pass, const AtlasLocation& loc, const glm::vec4& color,
             float left, float right, float topPx, float bottomPx, float texLeft, float texRight) {
        if (right <= left || bottomPx <= topPx) return;

        Quad quad;
        quad.glyph = glyph;
        quad.pass = pass;
        quad.page = loc.page;
        quad.color = color;
        quad.left = left;
        quad.right = right;
        quad.x0 = left / _worldScale;
        quad.x1 = right / _worldScale;
        quad.top = -topPx / _worldScale;
        quad.bottom = -bottomPx / _worldScale;
        quad.u0 = texLeft * _invPage;
        quad.u1 = texRight * _invPage;
        quad.vTop = static_cast<float>(loc.rect.y) * _invPage;
        quad.vBottom = static_cast<float>(loc.rect.y + loc.rect.height) * _invPage;

        bbMin = glm::min(bbMin, glm::vec2(quad.x0, quad.bottom));
        bbMax = glm::max(bbMax, glm::vec2(quad.x1, quad.top));
        quads.push_back(quad);
    }

    float _worldScale;
    float _invPage;
};

// Neighbors share a decoration when they sit on the same line with the same entry
bool continuesLine(const PositionedGlyph& a, const AtlasLocation& la,
                   const PositionedGlyph& b, const AtlasLocation& lb) {
    return !la.empty() && !lb.empty() && a.lineIndex == b.lineIndex && la == lb;
}

} // namespace

TextMesh MeshEmitter::emit(const ShapedText& shaped,
                           const std::vector<AtlasLocation>& locations,
                           const GlyphAtlas& atlas,
                           const TextStyling& styling) {
    return emit(shaped, locations, atlas.config().pageSize, styling);
}

TextMesh MeshEmitter::emit(const ShapedText& shaped,
                           const std::vector<AtlasLocation>& locations,
                           uint32_t pageSize,
                           const TextStyling& styling) {
    std::vector<GlyphLocations> layers(locations.size());
    for (size_t i = 0; i < locations.size(); ++i) {
        layers[i].fill = locations[i];
    }
    return emit(shaped, layers, pageSize, styling);
}

TextMesh MeshEmitter::emit(const ShapedText& shaped,
                           const std::vector<GlyphLocations>& locations,
                           const GlyphAtlas& atlas,
                           const TextStyling& styling) {
    return emit(shaped, locations, atlas.config().pageSize, styling);
}

TextMesh MeshEmitter::emit(const ShapedText& shaped,
                           const std::vector<GlyphLocations>& locations,
                           uint32_t pageSize,
                           const TextStyling& styling) {
    TextMesh mesh;
    if (locations.size() != shaped.glyphs.size()) {
        ywarn("MeshEmitter: {} glyphs but {} atlas locations", shaped.glyphs.size(),
              locations.size());
    }
    const size_t count = std::min(locations.size(), shaped.glyphs.size());
    const float worldScale = styling.worldScale > 0.0f ? styling.worldScale : 1.0f;
    const float em = styling.size > 0.0f ? styling.size : 1.0f;
    const float invPage = pageSize > 0 ? 1.0f / static_cast<float>(pageSize) : 0.0f;

    //-------------------------------------------------------------------------
    // Quads, one layer after the other, glyph order within a layer
    //-------------------------------------------------------------------------
    QuadBuilder builder(worldScale, invPage);
    for (size_t pass = 0; pass < std::size(LAYER_PASSES); ++pass) {
        const LayerPass& layer = LAYER_PASSES[pass];
        for (size_t i = 0; i < count; ++i) {
            const auto& glyph = shaped.glyphs[i];
            const AtlasLocation& loc = locations[i].*layer.location;
            if (loc.empty()) continue;
            const glm::vec4& color = layer.stroke ? glyph.strokeColor : glyph.color;

            if (!layer.line) {
                builder.addGlyph(i, pass, glyph, loc, color);
                continue;
            }

            const bool joinsPrev = i > 0 &&
                continuesLine(shaped.glyphs[i - 1], locations[i - 1].*layer.location, glyph, loc);
            const bool joinsNext = i + 1 < count &&
                continuesLine(glyph, loc, shaped.glyphs[i + 1], locations[i + 1].*layer.location);

            float min = glyph.origin.x;
            float max = glyph.origin.x + glyph.advance;
            if (joinsPrev) {
                const auto& prev = shaped.glyphs[i - 1];
                min = (prev.origin.x + prev.advance + glyph.origin.x) * 0.5f;
            }
            if (joinsNext) {
                const auto& next = shaped.glyphs[i + 1];
                max = (glyph.origin.x + glyph.advance + next.origin.x) * 0.5f;
            }
            builder.addLine(i, pass, glyph, loc, color, min, max, !joinsPrev, !joinsNext);
        }
    }

    const std::vector<Quad>& quads = builder.quads;
    if (quads.empty()) {
        return mesh;
    }

    // Layers of one glyph share its ordinal among the drawn glyphs
    std::vector<uint32_t> ordinals(count, 0);
    std::vector<bool> inked(count, false);
    for (const Quad& quad : quads) {
        inked[quad.glyph] = true;
    }
    uint32_t inkedCount = 0;
    for (size_t i = 0; i < count; ++i) {
        if (inked[i]) ordinals[i] = inkedCount++;
    }

    const glm::vec2 bbMin = builder.bbMin;
    const glm::vec2 dimension = builder.bbMax - bbMin;
    const glm::vec2 offset = -((builder.bbMax + bbMin) * 0.5f + styling.anchor * dimension);
    mesh.dimension = dimension;

    // Width of all earlier lines, for the single-line advance metas
    std::vector<float> lineOffsets(shaped.lines.size() + 1, 0.0f);
    for (size_t k = 0; k < shaped.lines.size(); ++k) {
        lineOffsets[k + 1] = lineOffsets[k] + shaped.lines[k].width;
    }

    //-------------------------------------------------------------------------
    // Vertices
    //-------------------------------------------------------------------------
    const auto quadCount = static_cast<uint32_t>(quads.size());
    mesh.vertices.reserve(quads.size() * 4);
    for (const Quad& quad : quads) {
        const auto& glyph = shaped.glyphs[quad.glyph];
        const float lineOffset = glyph.lineIndex < shaped.lines.size()
            ? lineOffsets[glyph.lineIndex] : 0.0f;

        const glm::vec4 color = srgbToLinear(quad.color);
        const glm::vec2 corners[4] = {
            {quad.x0, quad.bottom}, {quad.x1, quad.bottom},
            {quad.x0, quad.top},    {quad.x1, quad.top},
        };
        const glm::vec2 uvs[4] = {
            {quad.u0, quad.vBottom}, {quad.u1, quad.vBottom},
            {quad.u0, quad.vTop},    {quad.u1, quad.vTop},
        };

        for (size_t c = 0; c < 4; ++c) {
            TextVertex vertex;
            vertex.position = glm::vec3(corners[c] + offset, 0.0f);
            vertex.uv = uvs[c];
            vertex.color = color;

            // RowX and ColY are relative to the box before anchoring
            TextVertex local = vertex;
            local.position = glm::vec3(corners[c], 0.0f);
            const uint32_t ordinal = ordinals[quad.glyph];
            vertex.uvB.x = uvBComponent(styling.uvB.first, local, c, quad, glyph, ordinal,
                                        inkedCount, lineOffset, em, bbMin, dimension);
            vertex.uvB.y = uvBComponent(styling.uvB.second, local, c, quad, glyph, ordinal,
                                        inkedCount, lineOffset, em, bbMin, dimension);
            mesh.vertices.push_back(vertex);
        }
    }

    //-------------------------------------------------------------------------
    // Indices. Within a layer quads are grouped by page in order of first
    // use; layers stay in order so later layers draw on top.
    //-------------------------------------------------------------------------
    mesh.indices.reserve(quads.size() * 6);
    uint32_t first = 0;
    while (first < quadCount) {
        uint32_t last = first;
        while (last < quadCount && quads[last].pass == quads[first].pass) ++last;

        std::vector<uint32_t> pageOrder;
        std::map<uint32_t, std::vector<uint32_t>> quadsByPage;
        for (uint32_t q = first; q < last; ++q) {
            auto [it, inserted] = quadsByPage.try_emplace(quads[q].page);
            if (inserted) pageOrder.push_back(quads[q].page);
            it->second.push_back(q);
        }

        for (uint32_t page : pageOrder) {
            const auto start = static_cast<uint32_t>(mesh.indices.size());
            for (uint32_t q : quadsByPage[page]) {
                const uint32_t i = q * 4;
                mesh.indices.insert(mesh.indices.end(), {i, i + 1, i + 2, i + 1, i + 3, i + 2});
            }
            const auto added = static_cast<uint32_t>(mesh.indices.size()) - start;
            if (!mesh.submeshes.empty() && mesh.submeshes.back().page == page) {
                mesh.submeshes.back().indexCount += added;
            } else {
                mesh.submeshes.push_back(TextSubmesh{page, start, added});
            }
        }
        first = last;
    }

    ydebug("MeshEmitter: {} glyphs -> {} quads in {} submeshes", shaped.glyphs.size(),
           quadCount, mesh.submeshes.size());
    return mesh;
}

} // namespace richsdf
