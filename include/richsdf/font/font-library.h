#pragma once

#include <richsdf/font/freetype.h>
#include <richsdf/result.hpp>
#include <richsdf/shaping.h>
#include <richsdf/style.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace richsdf {
class Config;
}

namespace richsdf::font {

/// Vertical metrics scaled to a pixel size.
struct FontMetrics {
    float ascender = 0.0f;      // Above the baseline, positive
    float descender = 0.0f;     // Below the baseline, negative
    float lineGap = 0.0f;
    float lineSpacing = 0.0f;   // ascender - descender + lineGap
};

/// FontFace - one loaded face. Owns the font bytes and the FT_Face opened
/// over them on the creating thread. Metrics are read unscaled and scaled
/// linearly, so no FT_Set_Char_Size state is involved.
class FontFace {
public:
    using Ptr = std::shared_ptr<FontFace>;

    static Result<Ptr> create(FontId id, std::vector<uint8_t> data, std::string name) noexcept;

    ~FontFace() = default;

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    FontId id() const { return _id; }
    const std::string& name() const { return _name; }
    const std::string& family() const { return _family; }
    uint16_t weight() const { return _weight; }
    FontSlant slant() const { return _slant; }
    uint16_t unitsPerEm() const { return _unitsPerEm; }

    /// Raw font bytes, for opening per-thread faces.
    const std::vector<uint8_t>& data() const { return _data; }
    FT_Face face() const { return _face.get(); }

    /// 0 when the face has no glyph for the codepoint.
    uint32_t glyphIndex(uint32_t codepoint) const;

    float advance(uint32_t glyph, float pixelSize) const;
    float kerning(uint32_t left, uint32_t right, float pixelSize) const;
    FontMetrics metrics(float pixelSize) const;

private:
    FontFace(FontId id, std::vector<uint8_t> data, std::string name) noexcept;
    Result<void> init() noexcept;

    FontId _id;
    std::vector<uint8_t> _data;
    std::string _name;
    ScopedFace _face;
    std::string _family;
    uint16_t _weight = weight::Normal;
    FontSlant _slant = FontSlant::Normal;
    uint16_t _unitsPerEm = 1000;
    bool _hasKerning = false;
    mutable std::unordered_map<uint32_t, int32_t> _advanceCache;  // glyph -> font units
};

/// FontLibrary - registry of loaded faces grouped by family.
///
/// Fonts are loaded by explicit path or from memory; there is no system
/// font discovery. Generic names (sans-serif, serif, monospace) resolve
/// through aliases and fall back to the default face.
class FontLibrary {
public:
    using Ptr = std::shared_ptr<FontLibrary>;

    static Result<Ptr> create() noexcept;

    /// Loads every file under fonts.paths and reads text.fallback-glyph.
    static Result<Ptr> create(const Config& config) noexcept;

    ~FontLibrary() = default;

    FontLibrary(const FontLibrary&) = delete;
    FontLibrary& operator=(const FontLibrary&) = delete;

    Result<FontId> loadFile(const std::string& path);
    Result<FontId> loadMemory(std::vector<uint8_t> data, const std::string& name);

    FontFace::Ptr face(FontId id) const;
    size_t size() const { return _faces.size(); }

    /// Best face of a family for weight and slant, nullopt if the family
    /// (or alias target) is unknown. Case-insensitive.
    std::optional<FontId> resolve(const std::string& family, uint16_t weight,
                                  FontSlant slant) const;

    /// resolve() falling back to the default face.
    Result<FontId> select(const std::string& family, uint16_t weight, FontSlant slant) const;

    /// First loaded face unless set explicitly.
    std::optional<FontId> defaultFont() const;
    void setDefaultFont(FontId id);

    void setAlias(const std::string& name, const std::string& family);

    /// Families tried, in order, for codepoints the selected face lacks.
    void addFallbackFamily(const std::string& family);
    const std::vector<std::string>& fallbackFamilies() const { return _fallbackFamilies; }

    /// Glyph id used when no face has the codepoint (tofu).
    uint32_t fallbackGlyph() const { return _fallbackGlyph; }
    void setFallbackGlyph(uint32_t glyph) { _fallbackGlyph = glyph; }

private:
    FontLibrary() = default;

    static std::string normalize(const std::string& family);

    std::vector<FontFace::Ptr> _faces;
    std::map<std::string, std::vector<FontId>> _families;
    std::map<std::string, std::string> _aliases;
    std::vector<std::string> _fallbackFamilies;
    std::optional<FontId> _defaultFont;
    uint32_t _fallbackGlyph = 0;
};

} // namespace richsdf::font
