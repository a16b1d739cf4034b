//=============================================================================
// Font Tests - FontLibrary, FreetypeShaper and SdfRasterizer
//
// Run against DejaVu Sans when it is installed, skipped otherwise
//=============================================================================

#include <boost/ut.hpp>
#include <richsdf/font/font-library.h>
#include <richsdf/freetype-shaper.h>
#include <richsdf/sdf-rasterizer.h>

#include <cmath>
#include <filesystem>
#include <iostream>

using namespace boost::ut;
using namespace richsdf;

namespace {

constexpr const char* DEJAVU_SANS = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
constexpr const char* DEJAVU_SANS_BOLD = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

bool haveFonts() {
    static const bool found = [] {
        std::error_code ec;
        bool exists = std::filesystem::exists(DEJAVU_SANS, ec);
        if (!exists) {
            std::cerr << "font tests skipped: " << DEJAVU_SANS << " not found\n";
        }
        return exists;
    }();
    return found;
}

font::FontLibrary::Ptr loadFonts() {
    auto fonts = font::FontLibrary::create();
    if (!fonts) return nullptr;
    if (!(*fonts)->loadFile(DEJAVU_SANS)) return nullptr;
    std::error_code ec;
    if (std::filesystem::exists(DEJAVU_SANS_BOLD, ec)) {
        if (!(*fonts)->loadFile(DEJAVU_SANS_BOLD)) return nullptr;
    }
    return *fonts;
}

std::vector<StyledRun> plainRuns(const std::string& text) {
    return {StyledRun{text, SegmentStyle(), false, {}}};
}

} // namespace

suite font_library_tests = [] {
    "missing files fail to load"_test = [] {
        auto fonts = font::FontLibrary::create();
        expect(fonts.has_value() >> fatal);
        auto id = (*fonts)->loadFile("/nonexistent/font.ttf");
        expect(!id.has_value());
        expect(!(*fonts)->defaultFont().has_value());
    };

    if (!haveFonts()) return;

    "faces resolve by family weight and slant"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto regular = fonts->resolve("DejaVu Sans", weight::Normal, FontSlant::Normal);
        expect(regular.has_value() >> fatal);
        expect(fonts->face(*regular)->family() == "DejaVu Sans");

        auto generic = fonts->select("sans-serif", weight::Normal, FontSlant::Normal);
        expect(generic.has_value() && *generic == *regular);

        auto unknown = fonts->select("No Such Family", weight::Normal, FontSlant::Normal);
        expect(unknown.has_value() && *unknown == *fonts->defaultFont());

        if (fonts->size() > 1) {
            auto bold = fonts->resolve("dejavu sans", weight::Bold, FontSlant::Normal);
            expect(bold.has_value() >> fatal);
            expect(fonts->face(*bold)->weight() >= 600_u);
        }
    };

    "glyph lookup and metrics"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto face = fonts->face(*fonts->defaultFont());
        expect(face->glyphIndex('A') != 0_u);
        expect(face->glyphIndex(0x10FFFD) == 0_u);

        expect(face->advance(face->glyphIndex('M'), 32.0f) > 0.0_f);
        const float small = face->advance(face->glyphIndex('M'), 32.0f);
        const float large = face->advance(face->glyphIndex('M'), 64.0f);
        expect(std::abs(large - 2.0f * small) < 1e-3f);

        auto m = face->metrics(32.0f);
        expect(m.ascender > 0.0_f);
        expect(m.descender < 0.0_f);
        expect(m.lineSpacing >= m.ascender - m.descender - 1e-3f);
    };
};

suite freetype_shaper_tests = [] {
    if (!haveFonts()) return;

    "one glyph per character on one line"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto shaper = FreetypeShaper::create(fonts);
        expect(shaper.has_value() >> fatal);

        auto shaped = (*shaper)->shape(plainRuns("Hello"), TextStyling());
        expect(shaped.has_value() >> fatal);
        expect(shaped->glyphs.size() == 5_u);
        expect(shaped->lines.size() == 1_u);
        for (size_t i = 1; i < shaped->glyphs.size(); ++i) {
            expect(shaped->glyphs[i].origin.x > shaped->glyphs[i - 1].origin.x);
            expect(shaped->glyphs[i].origin.y == shaped->glyphs[0].origin.y);
        }
        expect(shaped->size.x > 0.0_f);
    };

    "newlines start new lines"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto shaper = *FreetypeShaper::create(fonts);

        auto shaped = shaper->shape(plainRuns("ab\ncd"), TextStyling());
        expect(shaped.has_value() >> fatal);
        expect(shaped->lines.size() == 2_u);
        expect(shaped->glyphs.size() == 4_u);
        expect(shaped->glyphs[2].lineIndex == 1_u);
        expect(shaped->glyphs[2].origin.y > shaped->glyphs[0].origin.y);
        expect(std::abs(shaped->glyphs[2].origin.x) < 1e-4f);
    };

    "max width wraps at spaces"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto shaper = *FreetypeShaper::create(fonts);

        TextStyling styling;
        styling.maxWidth = 100.0f;
        auto shaped = shaper->shape(plainRuns("one two three four"), styling);
        expect(shaped.has_value() >> fatal);
        expect(shaped->lines.size() > 1_u);
        for (const auto& line : shaped->lines) {
            expect(line.width <= 100.0f + 1e-3f);
        }
    };

    "runs keep their index and size attribute"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto shaper = *FreetypeShaper::create(fonts);

        SegmentStyle big;
        big.attributes["size"] = "64";
        std::vector<StyledRun> runs = {StyledRun{"a", SegmentStyle(), false, {}},
                                       StyledRun{"b", big, false, {}}};
        auto shaped = shaper->shape(runs, TextStyling());
        expect(shaped.has_value() >> fatal);
        expect(shaped->glyphs[0].runIndex == 0_u);
        expect(shaped->glyphs[1].runIndex == 1_u);
        expect(shaped->glyphs[1].pixelSize == 64.0_f);
    };

    "missing glyphs use the fallback glyph"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto shaper = *FreetypeShaper::create(fonts);

        auto shaped = shaper->shape(plainRuns("\xF4\x8F\xBF\xBD"), TextStyling());
        expect(shaped.has_value() >> fatal);
        expect(shaped->glyphs.size() == 1_u);
        expect(shaped->glyphs[0].glyphId == fonts->fallbackGlyph());
    };
};

suite sdf_rasterizer_tests = [] {
    if (!haveFonts()) return;

    "outlined glyphs produce a field"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = SdfRasterizer::create(fonts);
        expect(rasterizer.has_value() >> fatal);

        const FontId id = *fonts->defaultFont();
        const uint32_t glyph = fonts->face(id)->glyphIndex('A');
        auto image = (*rasterizer)->rasterize(glyph, id, 32.0f);
        expect(image.has_value() >> fatal);
        expect(!image->empty());
        expect(image->pixels.size() == size_t(image->width) * image->height);
        expect(image->margin >= 4_u);
        expect(image->bearingY > 0.0_f);
        expect(image->advance > 0.0_f);

        // Border is outside the outline, somewhere inside is not
        expect(image->pixels[0] < 128_i);
        bool inside = false;
        for (uint8_t p : image->pixels) inside = inside || p > 128;
        expect(inside);
    };

    "spaces have no field"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = *SdfRasterizer::create(fonts);

        const FontId id = *fonts->defaultFont();
        auto image = rasterizer->rasterize(fonts->face(id)->glyphIndex(' '), id, 32.0f);
        expect(image.has_value() >> fatal);
        expect(image->empty());
        expect(image->advance > 0.0_f);
    };

    "rasterization is deterministic across batches"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = *SdfRasterizer::create(fonts);

        const FontId id = *fonts->defaultFont();
        std::vector<AtlasKey> keys;
        for (char c = 'a'; c <= 'z'; ++c) {
            keys.push_back(AtlasKey::make(id, fonts->face(id)->glyphIndex(c), 24.0f, 0.0f, 1.0f, 1));
        }

        auto batch = rasterizer->rasterizeBatch(keys);
        expect(batch.size() == keys.size());
        for (size_t i = 0; i < keys.size(); ++i) {
            auto single = rasterizer->rasterize(keys[i]);
            expect(batch[i].has_value() && single.has_value());
            if (!batch[i] || !single) continue;
            expect(batch[i]->width == single->width);
            expect(batch[i]->height == single->height);
            expect(batch[i]->pixels == single->pixels);
        }
    };

    "outline rings are wider than the fill"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = *SdfRasterizer::create(fonts);

        const FontId id = *fonts->defaultFont();
        auto key = AtlasKey::make(id, fonts->face(id)->glyphIndex('A'), 32.0f, 0.0f, 1.0f, 1);
        auto fill = rasterizer->rasterize(key);
        key.stroke = 20;
        auto ring = rasterizer->rasterize(key);
        expect((fill.has_value() && ring.has_value()) >> fatal);

        // 20% of 32px is 3.2px each side of the outline
        expect(ring->margin == fill->margin + 4);
        expect(ring->width == fill->width + 8);
        expect(ring->height == fill->height + 8);
        expect(ring->advance == fill->advance);
        expect(ring->pixels[0] < 128_i);
    };

    "decoration lines come from the font metrics"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = *SdfRasterizer::create(fonts);
        const FontId id = *fonts->defaultFont();

        auto underline = rasterizer->rasterize(AtlasKey::make(id, UNDERLINE_GLYPH, 32.0f, 0.0f, 1.0f, 1));
        expect(underline.has_value() >> fatal);
        expect(!underline->empty());
        expect(underline->advance > 0.0_f);
        expect(underline->advance < 4.0_f);
        // Below the baseline
        expect(underline->bearingY < static_cast<float>(underline->height - underline->margin));

        auto strike = rasterizer->rasterize(AtlasKey::make(id, STRIKETHROUGH_GLYPH, 32.0f, 0.0f, 1.0f, 1));
        expect(strike.has_value() >> fatal);
        expect(!strike->empty());
        expect(strike->bearingY > underline->bearingY);
    };

    "unknown fonts are an error"_test = [] {
        auto fonts = loadFonts();
        expect((fonts != nullptr) >> fatal);
        auto rasterizer = *SdfRasterizer::create(fonts);
        auto image = rasterizer->rasterize(36, 999, 32.0f);
        expect(!image.has_value());
    };
};
