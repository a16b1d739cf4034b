#include <richsdf/style-sheet.h>
#include <richsdf/color.h>
#include <ytrace/ytrace.hpp>

namespace richsdf {

namespace {

Result<glm::vec4> colorField(const std::string& styleName, const std::string& key,
                             const YAML::Node& value) {
    const std::string text = value.as<std::string>();
    auto color = parseColor(text);
    if (!color) {
        return Err<glm::vec4>("style '" + styleName + "': invalid " + key + " '" + text + "'",
                              ErrorCode::Config);
    }
    return Ok(*color);
}

Result<SegmentStyle> parseEntry(const std::string& name, const YAML::Node& entry) {
    SegmentStyle style;
    if (!entry.IsMap()) {
        return Err<SegmentStyle>("style '" + name + "' must be a map", ErrorCode::Config);
    }

    try {
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            const YAML::Node& value = it->second;

            if (key == "color") {
                auto color = colorField(name, key, value);
                if (!color) return std::unexpected(color.error());
                style.fillColor = *color;
            } else if (key == "stroke-color") {
                auto color = colorField(name, key, value);
                if (!color) return std::unexpected(color.error());
                style.strokeColor = *color;
            } else if (key == "stroke") {
                style.stroke = value.as<uint16_t>();
            } else if (key == "fill") {
                style.fill = value.as<bool>();
            } else if (key == "font") {
                style.font = value.as<std::string>();
            } else if (key == "weight") {
                style.weight = value.as<uint16_t>();
            } else if (key == "italic") {
                style.slant = value.as<bool>() ? FontSlant::Italic : FontSlant::Normal;
            } else if (key == "underline") {
                style.underline = value.as<bool>();
            } else if (key == "strikethrough") {
                style.strikethrough = value.as<bool>();
            } else if (key == "magic") {
                style.magicNumber = value.as<float>();
            } else {
                style.attributes[key] = value.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<SegmentStyle>("style '" + name + "': " + e.what(), ErrorCode::Config);
    }
    return Ok(std::move(style));
}

} // namespace

Result<StyleSheet> StyleSheet::fromYaml(const YAML::Node& node) {
    StyleSheet sheet;
    if (!node || node.IsNull()) {
        return Ok(std::move(sheet));
    }
    if (!node.IsMap()) {
        return Err<StyleSheet>("styles must be a map of name -> attributes", ErrorCode::Config);
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string name = it->first.as<std::string>();
        auto style = parseEntry(name, it->second);
        if (!style) {
            return Err<StyleSheet>("Failed to load style sheet", style.error());
        }
        sheet.define(name, std::move(*style));
    }

    ydebug("StyleSheet: loaded {} styles", sheet.size());
    return Ok(std::move(sheet));
}

void StyleSheet::define(std::string name, SegmentStyle style) {
    _styles.insert_or_assign(std::move(name), std::move(style));
}

bool StyleSheet::remove(std::string_view name) {
    auto it = _styles.find(name);
    if (it == _styles.end()) return false;
    _styles.erase(it);
    return true;
}

const SegmentStyle* StyleSheet::find(std::string_view name) const {
    auto it = _styles.find(name);
    return it == _styles.end() ? nullptr : &it->second;
}

} // namespace richsdf
