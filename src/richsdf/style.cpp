#include <richsdf/style.h>
#include <richsdf/color.h>
#include <richsdf/config.h>
#include <ytrace/ytrace.hpp>

#include <utility>

namespace richsdf {

//=============================================================================
// StyleIds
//=============================================================================

StyleIds::Link::~Link() {
    // Unlink iteratively, a recursive release would follow the whole chain
    std::shared_ptr<Link> next = std::move(parent);
    while (next && next.use_count() == 1) {
        next = std::move(next->parent);
    }
}

StyleIds::StyleIds(std::initializer_list<std::string> ids) {
    for (const auto& id : ids) {
        push(id);
    }
}

void StyleIds::push(std::string id) {
    auto link = std::make_shared<Link>();
    link->id = std::move(id);
    link->depth = size() + 1;
    link->parent = std::move(_tail);
    _tail = std::move(link);
}

StyleIds StyleIds::extended(const StyleIds& inner) const {
    if (inner.empty()) return *this;
    if (empty()) return inner;
    StyleIds out = *this;
    for (auto& id : inner.toVector()) {
        out.push(std::move(id));
    }
    return out;
}

bool StyleIds::contains(std::string_view id) const {
    for (const Link* link = _tail.get(); link; link = link->parent.get()) {
        if (link->id == id) return true;
    }
    return false;
}

std::vector<std::string> StyleIds::toVector() const {
    std::vector<std::string> out(size());
    size_t i = out.size();
    for (const Link* link = _tail.get(); link; link = link->parent.get()) {
        out[--i] = link->id;
    }
    return out;
}

bool StyleIds::operator==(const StyleIds& other) const {
    if (size() != other.size()) return false;
    const Link* a = _tail.get();
    const Link* b = other._tail.get();
    while (a != b) {
        if (a->id != b->id) return false;
        a = a->parent.get();
        b = b->parent.get();
    }
    return true;
}

//=============================================================================
// SegmentStyle
//=============================================================================

SegmentStyle SegmentStyle::join(const SegmentStyle& inner) const {
    SegmentStyle out;
    out.styleIds = styleIds.extended(inner.styleIds);
    out.font = inner.font ? inner.font : font;
    out.fillColor = inner.fillColor ? inner.fillColor : fillColor;
    out.strokeColor = inner.strokeColor ? inner.strokeColor : strokeColor;
    out.stroke = inner.stroke ? inner.stroke : stroke;
    out.fill = inner.fill ? inner.fill : fill;
    out.weight = inner.weight ? inner.weight : weight;
    out.slant = inner.slant ? inner.slant : slant;
    out.underline = inner.underline ? inner.underline : underline;
    out.strikethrough = inner.strikethrough ? inner.strikethrough : strikethrough;
    out.magicNumber = inner.magicNumber ? inner.magicNumber : magicNumber;
    out.attributes = attributes;
    for (const auto& [key, value] : inner.attributes) {
        out.attributes[key] = value;
    }
    return out;
}

bool SegmentStyle::hasStyle(std::string_view id) const {
    return styleIds.contains(id);
}

TextStyling TextStyling::fromConfig(const Config& config) {
    TextStyling styling;
    styling.size = config.get<float>(Config::KEY_TEXT_SIZE, styling.size);
    styling.font = config.get<std::string>(Config::KEY_TEXT_FONT, styling.font);
    styling.lineHeight = config.get<float>(Config::KEY_TEXT_LINE_HEIGHT, styling.lineHeight);
    styling.tabWidth = static_cast<uint16_t>(
        config.get<int>(Config::KEY_TEXT_TAB_WIDTH, styling.tabWidth));
    styling.stroke = static_cast<uint16_t>(
        config.get<int>(Config::KEY_TEXT_STROKE, styling.stroke));
    if (auto color = config.get<std::string>(Config::KEY_TEXT_STROKE_COLOR)) {
        if (auto parsed = parseColor(*color)) {
            styling.strokeColor = *parsed;
        } else {
            ywarn("TextStyling: bad {} '{}'", Config::KEY_TEXT_STROKE_COLOR, *color);
        }
    }
    return styling;
}

} // namespace richsdf
