#include <richsdf/shaping.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace richsdf {

void deriveGlyphAttributes(ShapedText& shaped,
                           const std::vector<StyledRun>& runs,
                           const TextStyling& styling) {
    for (auto& glyph : shaped.glyphs) {
        glyph.color = styling.color;
        glyph.strokeColor = styling.strokeColor;
        glyph.stroke = styling.stroke;
        glyph.fill = styling.fill;
        glyph.underline = false;
        glyph.strikethrough = false;
        glyph.magicNumber = 0.0f;

        if (glyph.runIndex >= runs.size()) {
            ywarn("deriveGlyphAttributes: glyph {} has run index {} of {}",
                  glyph.glyphId, glyph.runIndex, runs.size());
            continue;
        }

        const SegmentStyle& style = runs[glyph.runIndex].style;
        glyph.color = style.fillColor.value_or(styling.color);
        glyph.strokeColor = style.strokeColor.value_or(styling.strokeColor);
        glyph.stroke = style.stroke.value_or(styling.stroke);
        glyph.fill = style.fill.value_or(styling.fill);
        glyph.underline = style.underline.value_or(false);
        glyph.strikethrough = style.strikethrough.value_or(false);
        glyph.magicNumber = style.magicNumber.value_or(0.0f);
    }

    for (const auto& line : shaped.lines) {
        if (static_cast<size_t>(line.firstGlyph) + line.glyphCount > shaped.glyphs.size()) {
            ywarn("deriveGlyphAttributes: line [{}, +{}) outside {} glyphs",
                  line.firstGlyph, line.glyphCount, shaped.glyphs.size());
            continue;
        }
        const float width = line.width;
        float lineStart = 0.0f;
        if (line.glyphCount > 0) {
            lineStart = shaped.glyphs[line.firstGlyph].origin.x;
        }
        for (uint32_t i = 0; i < line.glyphCount; ++i) {
            auto& glyph = shaped.glyphs[line.firstGlyph + i];
            if (width <= 0.0f) {
                glyph.lineProgress = 0.0f;
                continue;
            }
            float center = glyph.origin.x + glyph.advance * 0.5f - lineStart;
            glyph.lineProgress = std::clamp(center / width, 0.0f, 1.0f);
        }
    }
}

} // namespace richsdf
