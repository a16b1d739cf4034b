#pragma once

#include <richsdf/fetch-resolver.h>
#include <richsdf/result.hpp>
#include <richsdf/style.h>
#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace richsdf {

using FontId = uint32_t;
constexpr FontId INVALID_FONT = ~0u;

//-----------------------------------------------------------------------------
// PositionedGlyph - one glyph placed by the shaping engine
//
// origin is the pen position on the baseline, in pixels, y pointing down
// from the top of the text block. Fields below the marker are derived by
// the core from runIndex after shaping.
//-----------------------------------------------------------------------------
struct PositionedGlyph {
    uint32_t glyphId = 0;
    FontId font = INVALID_FONT;
    float pixelSize = 0.0f;
    glm::vec2 origin = {0.0f, 0.0f};
    float advance = 0.0f;
    uint32_t runIndex = 0;                      // Index into the input StyledRun list
    uint32_t lineIndex = 0;
    uint32_t codepoint = 0;                     // First codepoint of the cluster, 0 if unknown

    // Derived
    glm::vec4 color = {1.0f, 1.0f, 1.0f, 1.0f};  // sRGB fill
    glm::vec4 strokeColor = {1.0f, 1.0f, 1.0f, 1.0f};
    uint16_t stroke = 0;                        // Percent of pixelSize, 0 = none
    bool fill = true;
    bool underline = false;
    bool strikethrough = false;
    float magicNumber = 0.0f;
    float lineProgress = 0.0f;                  // Glyph center across its line, [0,1]
};

struct ShapedLine {
    float width = 0.0f;
    float baseline = 0.0f;                      // y of the baseline, pixels from the top
    uint32_t firstGlyph = 0;
    uint32_t glyphCount = 0;
};

struct ShapedText {
    std::vector<PositionedGlyph> glyphs;        // Visual order
    std::vector<ShapedLine> lines;
    glm::vec2 size = {0.0f, 0.0f};              // Bounding box of the layout in pixels
};

//=============================================================================
// ShapingEngine - styled runs in, positioned glyphs out
//
// Implementations may merge adjacent runs for kerning or ligatures; every
// glyph reports the run it came from so style can be recovered. Glyphs a
// font cannot supply come back as the configured fallback glyph.
//=============================================================================
class ShapingEngine {
public:
    using Ptr = std::shared_ptr<ShapingEngine>;

    virtual ~ShapingEngine() = default;

    virtual Result<ShapedText> shape(const std::vector<StyledRun>& runs,
                                     const TextStyling& styling) = 0;
};

// Re-derive colors, stroke, decorations, magic number and line progress
// from each glyph's run
void deriveGlyphAttributes(ShapedText& shaped,
                           const std::vector<StyledRun>& runs,
                           const TextStyling& styling);

} // namespace richsdf
