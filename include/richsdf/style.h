#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace richsdf {

class Config;

enum class FontSlant : uint8_t {
    Normal,
    Italic,
    Oblique,
};

namespace weight {
constexpr uint16_t Thin = 100;
constexpr uint16_t Light = 300;
constexpr uint16_t Normal = 400;
constexpr uint16_t Medium = 500;
constexpr uint16_t Bold = 700;
constexpr uint16_t Black = 900;
} // namespace weight

//-----------------------------------------------------------------------------
// StyleIds - applied style names, outer to inner
//
// Immutable list that shares its outer part with the scope it was extended
// from, so a scope nested N deep costs one link, not a copy of N names.
//-----------------------------------------------------------------------------
class StyleIds {
public:
    StyleIds() = default;
    StyleIds(std::initializer_list<std::string> ids);

    // This list followed by inner's names
    StyleIds extended(const StyleIds& inner) const;

    bool contains(std::string_view id) const;
    size_t size() const { return _tail ? _tail->depth : 0; }
    bool empty() const { return !_tail; }

    std::vector<std::string> toVector() const;

    bool operator==(const StyleIds& other) const;

private:
    struct Link {
        std::string id;
        std::shared_ptr<Link> parent;
        size_t depth = 0;

        ~Link();
    };

    void push(std::string id);

    std::shared_ptr<Link> _tail;
};

//-----------------------------------------------------------------------------
// SegmentStyle - accumulated style of a segment. Every field is optional so
// that nested scopes only override what they set.
//-----------------------------------------------------------------------------
struct SegmentStyle {
    StyleIds styleIds;
    std::optional<std::string> font;            // Font family
    std::optional<glm::vec4> fillColor;         // sRGB
    std::optional<glm::vec4> strokeColor;       // sRGB
    std::optional<uint16_t> stroke;             // Stroke width, percent of font size
    std::optional<bool> fill;                   // false = outline only
    std::optional<uint16_t> weight;
    std::optional<FontSlant> slant;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    std::optional<float> magicNumber;           // Shader-defined scalar
    std::map<std::string, std::string> attributes;  // Forwarded to shaping

    // Inner overrides outer, per field and per attribute key
    SegmentStyle join(const SegmentStyle& inner) const;

    bool hasStyle(std::string_view id) const;

    bool operator==(const SegmentStyle&) const = default;
};

enum class TextAlign : uint8_t {
    Left,
    Center,
    Right,
};

inline float alignFactor(TextAlign align) {
    switch (align) {
    case TextAlign::Left: return 0.0f;
    case TextAlign::Center: return 0.5f;
    case TextAlign::Right: return 1.0f;
    }
    return 0.0f;
}

// What each component of the auxiliary uv_b channel carries
enum class GlyphMeta : uint8_t {
    IndexFraction,      // quad index / quad count
    Index,              // quad index
    Advance,            // x in em as if the text were a single line, per vertex
    PerGlyphAdvance,    // same, at the glyph center
    RowX,               // x in [0,1] across the text block
    ColY,               // y in [0,1] across the text block
    LineProgress,       // glyph center across its line, [0,1]
    MagicNumber,        // SegmentStyle::magicNumber
};

//-----------------------------------------------------------------------------
// TextStyling - defaults for a whole text object
//-----------------------------------------------------------------------------
struct TextStyling {
    float size = 32.0f;                        // Pixel size
    std::string font = "sans-serif";
    uint16_t weight = weight::Normal;
    FontSlant slant = FontSlant::Normal;
    glm::vec4 color = {1.0f, 1.0f, 1.0f, 1.0f};
    glm::vec4 strokeColor = {1.0f, 1.0f, 1.0f, 1.0f};
    uint16_t stroke = 0;                       // Percent of the size, 0 = no stroke
    bool fill = true;
    TextAlign align = TextAlign::Left;
    glm::vec2 anchor = {0.0f, 0.0f};           // (-0.5,-0.5) bottom left .. (0.5,0.5) top right
    float lineHeight = 1.0f;                   // Multiplier of the font line spacing
    uint16_t tabWidth = 4;                     // In spaces
    float maxWidth = 0.0f;                     // Wrap width in pixels, 0 = no wrap
    float worldScale = 1.0f;                   // Pixels per mesh unit
    std::pair<GlyphMeta, GlyphMeta> uvB = {GlyphMeta::IndexFraction, GlyphMeta::LineProgress};

    static TextStyling fromConfig(const Config& config);
};

} // namespace richsdf
