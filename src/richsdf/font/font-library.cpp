#include <richsdf/font/font-library.h>
#include <richsdf/config.h>
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_ADVANCES_H
#include FT_TRUETYPE_TABLES_H

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>

namespace richsdf::font {

//=============================================================================
// FontFace
//=============================================================================

FontFace::FontFace(FontId id, std::vector<uint8_t> data, std::string name) noexcept
    : _id(id), _data(std::move(data)), _name(std::move(name)) {}

Result<FontFace::Ptr> FontFace::create(FontId id, std::vector<uint8_t> data,
                                       std::string name) noexcept {
    auto face = Ptr(new FontFace(id, std::move(data), std::move(name)));
    if (auto res = face->init(); !res) {
        return Err<Ptr>("FontFace '" + face->_name + "' creation failed", res);
    }
    return Ok(std::move(face));
}

Result<void> FontFace::init() noexcept {
    if (_data.empty()) {
        return Err("empty font data", ErrorCode::Font);
    }

    auto opened = openMemoryFace(_data.data(), _data.size());
    if (!opened) {
        return Err("open failed", opened);
    }
    _face = ScopedFace(*opened);
    FT_Face face = _face.get();

    if (!FT_IS_SCALABLE(face)) {
        return Err("face is not scalable", ErrorCode::Font);
    }

    _family = face->family_name ? face->family_name : _name;
    _unitsPerEm = face->units_per_EM > 0 ? face->units_per_EM : 1000;
    _hasKerning = FT_HAS_KERNING(face);

    auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF && os2->usWeightClass > 0) {
        _weight = os2->usWeightClass;
    } else if (face->style_flags & FT_STYLE_FLAG_BOLD) {
        _weight = weight::Bold;
    }
    if (face->style_flags & FT_STYLE_FLAG_ITALIC) {
        _slant = FontSlant::Italic;
    }

    ydebug("FontFace: {} family='{}' style='{}' weight={} upem={} glyphs={}",
           _id, _family, face->style_name ? face->style_name : "", _weight,
           _unitsPerEm, face->num_glyphs);
    return Ok();
}

uint32_t FontFace::glyphIndex(uint32_t codepoint) const {
    return FT_Get_Char_Index(_face.get(), codepoint);
}

float FontFace::advance(uint32_t glyph, float pixelSize) const {
    auto it = _advanceCache.find(glyph);
    if (it == _advanceCache.end()) {
        FT_Fixed units = 0;
        if (FT_Get_Advance(_face.get(), glyph, FT_LOAD_NO_SCALE, &units) != 0) {
            units = _unitsPerEm / 2;
        }
        it = _advanceCache.emplace(glyph, static_cast<int32_t>(units)).first;
    }
    return static_cast<float>(it->second) * pixelSize / _unitsPerEm;
}

float FontFace::kerning(uint32_t left, uint32_t right, float pixelSize) const {
    if (!_hasKerning || left == 0 || right == 0) return 0.0f;
    FT_Vector delta{0, 0};
    if (FT_Get_Kerning(_face.get(), left, right, FT_KERNING_UNSCALED, &delta) != 0) {
        return 0.0f;
    }
    return static_cast<float>(delta.x) * pixelSize / _unitsPerEm;
}

FontMetrics FontFace::metrics(float pixelSize) const {
    FT_Face face = _face.get();
    const float scale = pixelSize / _unitsPerEm;
    FontMetrics m;
    m.ascender = static_cast<float>(face->ascender) * scale;
    m.descender = static_cast<float>(face->descender) * scale;
    float height = static_cast<float>(face->height) * scale;
    m.lineGap = std::max(0.0f, height - (m.ascender - m.descender));
    m.lineSpacing = m.ascender - m.descender + m.lineGap;
    if (m.lineSpacing <= 0.0f) {
        m.lineSpacing = pixelSize * 1.2f;
    }
    return m;
}

//=============================================================================
// FontLibrary
//=============================================================================

Result<FontLibrary::Ptr> FontLibrary::create() noexcept {
    auto library = Ptr(new FontLibrary());
    library->_aliases["sans-serif"] = "";
    library->_aliases["serif"] = "";
    library->_aliases["monospace"] = "";
    return Ok(std::move(library));
}

Result<FontLibrary::Ptr> FontLibrary::create(const Config& config) noexcept {
    auto res = create();
    if (!res) return res;
    auto library = *res;

    for (const auto& path : config.getStringList(Config::KEY_FONTS_PATHS)) {
        if (auto loaded = library->loadFile(path); !loaded) {
            return Err<Ptr>("Failed to load configured fonts", loaded);
        }
    }
    library->setFallbackGlyph(config.get<uint32_t>(Config::KEY_TEXT_FALLBACK_GLYPH, 0));
    return Ok(std::move(library));
}

Result<FontId> FontLibrary::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<FontId>("Cannot open font file: " + path, ErrorCode::Font);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    auto res = loadMemory(std::move(data), path);
    if (!res) {
        return Err<FontId>("Failed to load font " + path, res);
    }
    yinfo("FontLibrary: loaded {} as font {}", path, *res);
    return res;
}

Result<FontId> FontLibrary::loadMemory(std::vector<uint8_t> data, const std::string& name) {
    const auto id = static_cast<FontId>(_faces.size());
    auto face = FontFace::create(id, std::move(data), name);
    if (!face) {
        return Err<FontId>("FontLibrary: load failed", face);
    }
    _families[normalize((*face)->family())].push_back(id);
    _faces.push_back(std::move(*face));
    if (!_defaultFont) {
        _defaultFont = id;
    }
    return Ok(id);
}

FontFace::Ptr FontLibrary::face(FontId id) const {
    if (id >= _faces.size()) return nullptr;
    return _faces[id];
}

std::optional<FontId> FontLibrary::resolve(const std::string& family, uint16_t weight,
                                           FontSlant slant) const {
    std::string key = normalize(family);
    auto alias = _aliases.find(key);
    if (alias != _aliases.end()) {
        if (alias->second.empty()) {
            // Generic family with no mapping: pick from the default face's family
            if (!_defaultFont) return std::nullopt;
            key = normalize(_faces[*_defaultFont]->family());
        } else {
            key = normalize(alias->second);
        }
    }

    auto it = _families.find(key);
    if (it == _families.end()) return std::nullopt;

    // Slant mismatch outweighs any weight distance
    std::optional<FontId> best;
    int bestScore = 0;
    for (FontId id : it->second) {
        const auto& candidate = _faces[id];
        int score = std::abs(static_cast<int>(candidate->weight()) - static_cast<int>(weight));
        if (candidate->slant() != slant) score += 1000;
        if (!best || score < bestScore) {
            best = id;
            bestScore = score;
        }
    }
    return best;
}

Result<FontId> FontLibrary::select(const std::string& family, uint16_t weight,
                                   FontSlant slant) const {
    if (auto id = resolve(family, weight, slant)) {
        return Ok(*id);
    }
    if (_defaultFont) {
        // Same family as the default face, so weight and slant still apply
        if (auto id = resolve(_faces[*_defaultFont]->family(), weight, slant)) {
            return Ok(*id);
        }
        return Ok(*_defaultFont);
    }
    return Err<FontId>("No font loaded (wanted '" + family + "')", ErrorCode::Font);
}

std::optional<FontId> FontLibrary::defaultFont() const {
    return _defaultFont;
}

void FontLibrary::setDefaultFont(FontId id) {
    if (id < _faces.size()) {
        _defaultFont = id;
    } else {
        ywarn("FontLibrary: setDefaultFont({}) ignored, {} faces loaded", id, _faces.size());
    }
}

void FontLibrary::setAlias(const std::string& name, const std::string& family) {
    _aliases[normalize(name)] = family;
}

void FontLibrary::addFallbackFamily(const std::string& family) {
    _fallbackFamilies.push_back(family);
}

std::string FontLibrary::normalize(const std::string& family) {
    std::string out(family);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace richsdf::font
