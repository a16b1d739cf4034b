//=============================================================================
// MeshEmitter Tests - quad layout, UVs, uv_b and submesh grouping
//=============================================================================

#include <boost/ut.hpp>
#include <richsdf/mesh-emitter.h>

#include <cmath>

using namespace boost::ut;
using namespace richsdf;

namespace {

constexpr uint32_t PAGE = 128;

bool near(float a, float b) {
    return std::abs(a - b) < 1e-4f;
}

bool near(const glm::vec3& a, float x, float y) {
    return near(a.x, x) && near(a.y, y) && near(a.z, 0.0f);
}

// Glyphs every 12px on baseline 20, each with a 10x20 image 15px above it
ShapedText makeLine(size_t count) {
    ShapedText shaped;
    for (size_t i = 0; i < count; ++i) {
        PositionedGlyph g;
        g.glyphId = static_cast<uint32_t>('a' + i);
        g.font = 0;
        g.pixelSize = 32.0f;
        g.origin = {12.0f * static_cast<float>(i), 20.0f};
        g.advance = 12.0f;
        g.lineProgress = static_cast<float>(i) / static_cast<float>(count);
        shaped.glyphs.push_back(g);
    }
    ShapedLine line;
    line.width = 12.0f * static_cast<float>(count);
    line.baseline = 20.0f;
    line.glyphCount = static_cast<uint32_t>(count);
    shaped.lines.push_back(line);
    return shaped;
}

AtlasLocation glyphAt(uint32_t page, uint32_t x, uint32_t y) {
    AtlasLocation loc;
    loc.page = page;
    loc.rect = {x, y, 10, 20};
    loc.bearingX = 0.0f;
    loc.bearingY = 15.0f;
    loc.advance = 12.0f;
    loc.pixelSize = 32.0f;
    return loc;
}

// A 6x6 line square, 2px thick, centered just below the baseline
AtlasLocation lineAt(uint32_t page, uint32_t x, uint32_t y) {
    AtlasLocation loc;
    loc.page = page;
    loc.rect = {x, y, 6, 6};
    loc.bearingX = -3.0f;
    loc.bearingY = 1.0f;
    loc.advance = 2.0f;
    loc.pixelSize = 32.0f;
    return loc;
}

float width(const TextMesh& mesh, size_t quad) {
    return mesh.vertices[quad * 4 + 1].position.x - mesh.vertices[quad * 4].position.x;
}

} // namespace

suite mesh_emitter_tests = [] {
    "one quad per glyph with an image"_test = [] {
        auto shaped = makeLine(3);
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0), glyphAt(0, 20, 0), {}};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        expect(mesh.quadCount() == 2_u);
        expect(mesh.vertices.size() == 8_u);
        expect(mesh.indices.size() == 12_u);
        expect(mesh.indices[0] == 0_u && mesh.indices[1] == 1_u && mesh.indices[2] == 2_u);
        expect(mesh.indices[3] == 1_u && mesh.indices[4] == 3_u && mesh.indices[5] == 2_u);
        expect(mesh.indices[6] == 4_u && mesh.indices[10] == 7_u);
    };

    "quads are centered on the origin by default"_test = [] {
        auto shaped = makeLine(2);
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0), glyphAt(0, 20, 0)};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        // Block spans x 0..22, y -25..-5 before centering
        expect(near(mesh.dimension.x, 22.0f) && near(mesh.dimension.y, 20.0f));
        expect(near(mesh.vertices[0].position, -11.0f, -10.0f));
        expect(near(mesh.vertices[1].position, -1.0f, -10.0f));
        expect(near(mesh.vertices[2].position, -11.0f, 10.0f));
        expect(near(mesh.vertices[3].position, -1.0f, 10.0f));
        expect(near(mesh.vertices[7].position, 11.0f, 10.0f));
    };

    "anchor moves the bounding box"_test = [] {
        auto shaped = makeLine(2);
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0), glyphAt(0, 20, 0)};
        TextStyling styling;
        styling.anchor = {-0.5f, -0.5f};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, styling);
        expect(near(mesh.vertices[0].position, 0.0f, 0.0f));
        expect(near(mesh.vertices[7].position, 22.0f, 20.0f));
    };

    "world scale divides positions"_test = [] {
        auto shaped = makeLine(2);
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0), glyphAt(0, 20, 0)};
        TextStyling styling;
        styling.worldScale = 2.0f;

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, styling);
        expect(near(mesh.dimension.x, 11.0f) && near(mesh.dimension.y, 10.0f));
    };

    "uvs address the atlas rect"_test = [] {
        auto shaped = makeLine(1);
        std::vector<AtlasLocation> locations = {glyphAt(0, 32, 64)};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        const auto& v = mesh.vertices;
        expect(near(v[0].uv.x, 32.0f / PAGE) && near(v[0].uv.y, 84.0f / PAGE));
        expect(near(v[1].uv.x, 42.0f / PAGE) && near(v[1].uv.y, 84.0f / PAGE));
        expect(near(v[2].uv.x, 32.0f / PAGE) && near(v[2].uv.y, 64.0f / PAGE));
        expect(near(v[3].uv.x, 42.0f / PAGE) && near(v[3].uv.y, 64.0f / PAGE));
    };

    "uv_b x runs from 0 to (N-1)/N"_test = [] {
        constexpr size_t N = 6;
        auto shaped = makeLine(N);
        std::vector<AtlasLocation> locations;
        for (uint32_t i = 0; i < N; ++i) {
            locations.push_back(glyphAt(0, i * 11, 0));
        }

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        expect(mesh.quadCount() == N);
        float previous = -1.0f;
        for (size_t q = 0; q < N; ++q) {
            const float x = mesh.vertices[q * 4].uvB.x;
            expect(near(x, static_cast<float>(q) / N));
            expect(x >= previous);
            previous = x;
            for (size_t c = 1; c < 4; ++c) {
                expect(near(mesh.vertices[q * 4 + c].uvB.x, x));
            }
            expect(near(mesh.vertices[q * 4].uvB.y, shaped.glyphs[q].lineProgress));
        }
    };

    "uv_b sources are configurable"_test = [] {
        auto shaped = makeLine(2);
        shaped.glyphs[1].magicNumber = 0.25f;
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0), glyphAt(0, 20, 0)};
        TextStyling styling;
        styling.uvB = {GlyphMeta::Index, GlyphMeta::MagicNumber};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, styling);
        expect(near(mesh.vertices[4].uvB.x, 1.0f));
        expect(near(mesh.vertices[4].uvB.y, 0.25f));

        styling.uvB = {GlyphMeta::RowX, GlyphMeta::ColY};
        mesh = MeshEmitter::emit(shaped, locations, PAGE, styling);
        expect(near(mesh.vertices[0].uvB.x, 0.0f) && near(mesh.vertices[0].uvB.y, 0.0f));
        expect(near(mesh.vertices[7].uvB.x, 1.0f) && near(mesh.vertices[7].uvB.y, 1.0f));

        styling.uvB = {GlyphMeta::Advance, GlyphMeta::PerGlyphAdvance};
        mesh = MeshEmitter::emit(shaped, locations, PAGE, styling);
        expect(near(mesh.vertices[5].uvB.x, 22.0f / 32.0f));
        expect(near(mesh.vertices[5].uvB.y, 17.0f / 32.0f));
    };

    "one submesh per page in order of first use"_test = [] {
        auto shaped = makeLine(3);
        std::vector<AtlasLocation> locations = {glyphAt(1, 0, 0), glyphAt(0, 0, 0),
                                                glyphAt(1, 20, 0)};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        expect(mesh.submeshes.size() == 2_u);
        expect(mesh.submeshes[0].page == 1_u);
        expect(mesh.submeshes[0].firstIndex == 0_u);
        expect(mesh.submeshes[0].indexCount == 12_u);
        expect(mesh.submeshes[1].page == 0_u);
        expect(mesh.submeshes[1].firstIndex == 12_u);
        expect(mesh.submeshes[1].indexCount == 6_u);
        // Page 1 draws quads 0 and 2, page 0 draws quad 1
        expect(mesh.indices[6] == 8_u);
        expect(mesh.indices[12] == 4_u);
    };

    "vertex colors are linear"_test = [] {
        auto shaped = makeLine(1);
        shaped.glyphs[0].color = {0.5f, 1.0f, 0.0f, 0.5f};
        std::vector<AtlasLocation> locations = {glyphAt(0, 0, 0)};

        auto mesh = MeshEmitter::emit(shaped, locations, PAGE, TextStyling());
        const auto& color = mesh.vertices[0].color;
        expect(color.x < 0.5f && color.x > 0.2f);
        expect(near(color.y, 1.0f) && near(color.z, 0.0f) && near(color.w, 0.5f));
    };

    "no glyphs give an empty mesh"_test = [] {
        ShapedText shaped;
        auto mesh = MeshEmitter::emit(shaped, std::vector<AtlasLocation>{}, PAGE, TextStyling());
        expect(mesh.empty());
        expect(mesh.indices.empty());
        expect(mesh.submeshes.empty());

        auto spaces = makeLine(2);
        mesh = MeshEmitter::emit(spaces, std::vector<AtlasLocation>(2), PAGE, TextStyling());
        expect(mesh.empty());
    };

    "the outline draws behind the fill in the stroke color"_test = [] {
        auto shaped = makeLine(1);
        shaped.glyphs[0].color = {1.0f, 1.0f, 1.0f, 1.0f};
        shaped.glyphs[0].strokeColor = {0.0f, 0.0f, 1.0f, 1.0f};

        GlyphLocations layers;
        layers.fill = glyphAt(0, 0, 0);
        layers.stroke = glyphAt(0, 40, 0);
        layers.stroke.rect.width = 14;
        layers.stroke.rect.height = 24;
        layers.stroke.bearingX = -2.0f;
        layers.stroke.bearingY = 17.0f;

        auto mesh = MeshEmitter::emit(shaped, std::vector<GlyphLocations>{layers}, PAGE,
                                      TextStyling());
        expect(mesh.quadCount() == 2_u >> fatal);
        expect(near(width(mesh, 0), 14.0f));
        expect(near(width(mesh, 1), 10.0f));
        expect(near(mesh.vertices[0].uv.x, 40.0f / PAGE));
        expect(near(mesh.vertices[0].color.z, 1.0f) && near(mesh.vertices[0].color.x, 0.0f));
        expect(near(mesh.vertices[4].color.x, 1.0f));

        // Both layers belong to the only drawn glyph
        expect(near(mesh.vertices[0].uvB.x, 0.0f) && near(mesh.vertices[4].uvB.x, 0.0f));
        expect(mesh.submeshes.size() == 1_u);
        expect(mesh.submeshes[0].indexCount == 12_u);
    };

    "an underline runs under neighbors with caps at the ends"_test = [] {
        auto shaped = makeLine(2);
        std::vector<GlyphLocations> layers(2);
        layers[0].fill = glyphAt(0, 0, 0);
        layers[1].fill = glyphAt(0, 20, 0);
        layers[0].underline = lineAt(0, 60, 0);
        layers[1].underline = lineAt(0, 60, 0);

        auto mesh = MeshEmitter::emit(shaped, layers, PAGE, TextStyling());
        // Two fills, then start cap and body, then body and end cap
        expect(mesh.quadCount() == 6_u >> fatal);
        expect(near(width(mesh, 2), 3.0f));
        expect(near(width(mesh, 3), 11.0f));
        expect(near(width(mesh, 4), 11.0f));
        expect(near(width(mesh, 5), 3.0f));

        // The first body starts where the cap ends and the bodies meet
        expect(near(mesh.vertices[12].position.x, mesh.vertices[9].position.x));
        expect(near(mesh.vertices[16].position.x, mesh.vertices[13].position.x));

        // Caps take the outer halves of the square, bodies its center column
        expect(near(mesh.vertices[8].uv.x, 60.0f / PAGE));
        expect(near(mesh.vertices[9].uv.x, 63.0f / PAGE));
        expect(near(mesh.vertices[12].uv.x, 63.0f / PAGE));
        expect(near(mesh.vertices[13].uv.x, 63.0f / PAGE));
        expect(near(mesh.vertices[21].uv.x, 66.0f / PAGE));

        // Line pieces carry the ordinal of their glyph
        expect(near(mesh.vertices[8].uvB.x, 0.0f));
        expect(near(mesh.vertices[20].uvB.x, 0.5f));

        // Fill and underline passes share page 0
        expect(mesh.submeshes.size() == 1_u);
        expect(mesh.submeshes[0].indexCount == 36_u);
    };

    "strikethrough draws over fill and underline"_test = [] {
        auto shaped = makeLine(1);
        GlyphLocations layers;
        layers.fill = glyphAt(0, 0, 0);
        layers.underline = lineAt(0, 60, 0);
        layers.strikethrough = lineAt(1, 80, 0);

        auto mesh = MeshEmitter::emit(shaped, std::vector<GlyphLocations>{layers}, PAGE,
                                      TextStyling());
        expect(mesh.quadCount() == 7_u >> fatal);
        expect(near(mesh.vertices[0].uv.x, 0.0f));
        expect(near(mesh.vertices[4].uv.x, 60.0f / PAGE));
        expect(near(mesh.vertices[16].uv.x, 80.0f / PAGE));

        expect(mesh.submeshes.size() == 2_u);
        expect(mesh.submeshes[0].page == 0_u);
        expect(mesh.submeshes[0].indexCount == 24_u);
        expect(mesh.submeshes[1].page == 1_u);
        expect(mesh.submeshes[1].firstIndex == 24_u);
    };

    "separate lines do not join their decorations"_test = [] {
        auto shaped = makeLine(2);
        shaped.glyphs[1].lineIndex = 1;
        std::vector<GlyphLocations> layers(2);
        layers[0].underline = lineAt(0, 60, 0);
        layers[1].underline = lineAt(0, 60, 0);

        auto mesh = MeshEmitter::emit(shaped, layers, PAGE, TextStyling());
        expect(mesh.quadCount() == 6_u);
    };
};
