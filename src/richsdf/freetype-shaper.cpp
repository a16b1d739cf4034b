#include <richsdf/freetype-shaper.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <charconv>
#include <map>
#include <string_view>

namespace richsdf {

namespace {

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

// Decode one codepoint at pos; returns bytes consumed (at least 1).
// Malformed sequences yield U+FFFD for their first byte.
size_t decodeUtf8(std::string_view text, size_t pos, uint32_t& cp) {
    const auto lead = static_cast<uint8_t>(text[pos]);
    size_t len = 0;
    uint32_t min = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F; len = 2; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F; len = 3; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07; len = 4; min = 0x10000;
    } else {
        cp = REPLACEMENT_CHAR;
        return 1;
    }

    if (pos + len > text.size()) {
        cp = REPLACEMENT_CHAR;
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<uint8_t>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            cp = REPLACEMENT_CHAR;
            return 1;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = REPLACEMENT_CHAR;
    }
    return len;
}

bool isBreakSpace(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == 0x3000;
}

struct RunFont {
    FontId font = INVALID_FONT;
    float size = 0.0f;
    std::vector<FontId> fallbacks;
};

struct LineBuild {
    std::vector<PositionedGlyph> glyphs;
    int lastSpace = -1;     // Index of the last break space on the line
};

float runPixelSize(const StyledRun& run, const TextStyling& styling) {
    auto it = run.style.attributes.find("size");
    if (it == run.style.attributes.end()) return styling.size;
    float size = 0.0f;
    const std::string& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), size);
    if (ec != std::errc() || ptr != text.data() + text.size() || !(size > 0.0f)) {
        ywarn("FreetypeShaper: ignoring size attribute '{}'", text);
        return styling.size;
    }
    return size;
}

} // namespace

Result<FreetypeShaper::Ptr> FreetypeShaper::create(font::FontLibrary::Ptr fonts) noexcept {
    if (!fonts) {
        return Err<Ptr>("FreetypeShaper: no font library", ErrorCode::InvalidArgument);
    }
    return Ok(Ptr(new FreetypeShaper(std::move(fonts))));
}

Result<ShapedText> FreetypeShaper::shape(const std::vector<StyledRun>& runs,
                                         const TextStyling& styling) {
    auto defaultFont = _fonts->select(styling.font, styling.weight, styling.slant);
    if (!defaultFont) {
        return Err<ShapedText>("FreetypeShaper: no default font", defaultFont);
    }

    //-------------------------------------------------------------------------
    // Font selection per run
    //-------------------------------------------------------------------------
    std::vector<RunFont> runFonts;
    runFonts.reserve(runs.size());
    for (const auto& run : runs) {
        const std::string& family = run.style.font ? *run.style.font : styling.font;
        const uint16_t weight = run.style.weight.value_or(styling.weight);
        const FontSlant slant = run.style.slant.value_or(styling.slant);

        RunFont rf;
        auto selected = _fonts->select(family, weight, slant);
        if (!selected) {
            return Err<ShapedText>("FreetypeShaper: font selection failed", selected);
        }
        rf.font = *selected;
        rf.size = runPixelSize(run, styling);
        for (const auto& fallback : _fonts->fallbackFamilies()) {
            auto id = _fonts->resolve(fallback, weight, slant);
            if (id && *id != rf.font &&
                std::find(rf.fallbacks.begin(), rf.fallbacks.end(), *id) == rf.fallbacks.end()) {
                rf.fallbacks.push_back(*id);
            }
        }
        runFonts.push_back(std::move(rf));
    }

    //-------------------------------------------------------------------------
    // Place glyphs on lines, x relative to the line start
    //-------------------------------------------------------------------------
    std::vector<LineBuild> lines(1);
    float pen = 0.0f;
    uint32_t prevGlyph = 0;
    FontId prevFont = INVALID_FONT;
    float prevSize = 0.0f;

    for (uint32_t r = 0; r < runs.size(); ++r) {
        const RunFont& rf = runFonts[r];
        const auto primary = _fonts->face(rf.font);
        const std::string& text = runs[r].text;

        size_t pos = 0;
        while (pos < text.size()) {
            uint32_t cp = 0;
            pos += decodeUtf8(text, pos, cp);

            if (cp == '\r') continue;
            if (cp == '\n') {
                lines.emplace_back();
                pen = 0.0f;
                prevGlyph = 0;
                continue;
            }

            FontId fontId = rf.font;
            uint32_t glyph = 0;
            float advance = 0.0f;
            if (cp == '\t') {
                glyph = primary->glyphIndex(' ');
                advance = primary->advance(glyph, rf.size) * styling.tabWidth;
            } else {
                glyph = primary->glyphIndex(cp);
                if (glyph == 0) {
                    for (FontId fallback : rf.fallbacks) {
                        if (uint32_t g = _fonts->face(fallback)->glyphIndex(cp)) {
                            fontId = fallback;
                            glyph = g;
                            break;
                        }
                    }
                }
                if (glyph == 0) {
                    ydebug("FreetypeShaper: U+{:04X} missing, using glyph {}",
                           cp, _fonts->fallbackGlyph());
                    glyph = _fonts->fallbackGlyph();
                }
                advance = _fonts->face(fontId)->advance(glyph, rf.size);
            }

            if (prevGlyph != 0 && prevFont == fontId && prevSize == rf.size) {
                pen += _fonts->face(fontId)->kerning(prevGlyph, glyph, rf.size);
            }

            const bool space = isBreakSpace(cp);
            LineBuild* line = &lines.back();
            if (styling.maxWidth > 0.0f && !space && !line->glyphs.empty() &&
                pen + advance > styling.maxWidth) {
                // Carry the word after the last space to a new line
                LineBuild next;
                if (line->lastSpace >= 0) {
                    auto first = line->glyphs.begin() + line->lastSpace + 1;
                    if (first != line->glyphs.end()) {
                        const float shift = first->origin.x;
                        for (auto it = first; it != line->glyphs.end(); ++it) {
                            it->origin.x -= shift;
                            next.glyphs.push_back(*it);
                        }
                        line->glyphs.erase(first, line->glyphs.end());
                        pen -= shift;
                    } else {
                        pen = 0.0f;
                    }
                } else {
                    pen = 0.0f;
                }
                lines.push_back(std::move(next));
                line = &lines.back();

                // Still too wide: break inside the word
                if (!line->glyphs.empty() && pen + advance > styling.maxWidth) {
                    lines.emplace_back();
                    line = &lines.back();
                    pen = 0.0f;
                }
            }

            PositionedGlyph g;
            g.glyphId = glyph;
            g.font = fontId;
            g.pixelSize = rf.size;
            g.origin = {pen, 0.0f};
            g.advance = advance;
            g.runIndex = r;
            g.codepoint = cp;
            if (space) {
                line->lastSpace = static_cast<int>(line->glyphs.size());
            }
            line->glyphs.push_back(g);

            pen += advance;
            prevGlyph = glyph;
            prevFont = fontId;
            prevSize = rf.size;
        }
    }

    //-------------------------------------------------------------------------
    // Baselines, widths and alignment
    //-------------------------------------------------------------------------
    std::map<std::pair<FontId, float>, font::FontMetrics> metricsCache;
    auto metricsFor = [&](FontId id, float size) -> const font::FontMetrics& {
        auto key = std::make_pair(id, size);
        auto it = metricsCache.find(key);
        if (it == metricsCache.end()) {
            it = metricsCache.emplace(key, _fonts->face(id)->metrics(size)).first;
        }
        return it->second;
    };

    struct LineInfo {
        float width = 0.0f;
        float baseline = 0.0f;
    };
    std::vector<LineInfo> infos(lines.size());
    float baseline = 0.0f;
    float bottom = 0.0f;
    float blockWidth = 0.0f;

    for (size_t k = 0; k < lines.size(); ++k) {
        const auto& glyphs = lines[k].glyphs;
        float ascender = 0.0f;
        float descender = 0.0f;
        float spacing = 0.0f;
        if (glyphs.empty()) {
            const auto& m = metricsFor(*defaultFont, styling.size);
            ascender = m.ascender;
            descender = m.descender;
            spacing = m.lineSpacing;
        }
        for (const auto& g : glyphs) {
            const auto& m = metricsFor(g.font, g.pixelSize);
            ascender = std::max(ascender, m.ascender);
            descender = std::min(descender, m.descender);
            spacing = std::max(spacing, m.lineSpacing);
        }

        baseline = k == 0 ? ascender : baseline + spacing * styling.lineHeight;
        bottom = baseline - descender;

        float width = 0.0f;
        for (auto it = glyphs.rbegin(); it != glyphs.rend(); ++it) {
            if (!isBreakSpace(it->codepoint)) {
                width = it->origin.x + it->advance;
                break;
            }
        }
        infos[k] = {width, baseline};
        blockWidth = std::max(blockWidth, width);
    }

    ShapedText out;
    for (size_t k = 0; k < lines.size(); ++k) {
        const float offset = (blockWidth - infos[k].width) * alignFactor(styling.align);
        ShapedLine shapedLine;
        shapedLine.width = infos[k].width;
        shapedLine.baseline = infos[k].baseline;
        shapedLine.firstGlyph = static_cast<uint32_t>(out.glyphs.size());
        shapedLine.glyphCount = static_cast<uint32_t>(lines[k].glyphs.size());
        for (auto g : lines[k].glyphs) {
            g.origin.x += offset;
            g.origin.y = infos[k].baseline;
            g.lineIndex = static_cast<uint32_t>(k);
            out.glyphs.push_back(g);
        }
        out.lines.push_back(shapedLine);
    }
    out.size = {blockWidth, bottom};

    ydebug("FreetypeShaper: {} runs -> {} glyphs on {} lines, {}x{}",
           runs.size(), out.glyphs.size(), out.lines.size(), out.size.x, out.size.y);
    return Ok(std::move(out));
}

} // namespace richsdf
