#pragma once

#include <richsdf/result.hpp>
#include <richsdf/style.h>
#include <yaml-cpp/yaml.h>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace richsdf {

//=============================================================================
// StyleSheet - named styles used by {name:...} scopes
//
// YAML form (the "styles" config key):
//
//   styles:
//     title:  { color: "#ffcc00", weight: 700, size: "48" }
//     ghost:  { stroke: 4, stroke-color: white, fill: false }
//
// Known keys map onto SegmentStyle fields, anything else is kept in the
// attribute bag and handed to the shaping engine.
//=============================================================================
class StyleSheet {
public:
    StyleSheet() = default;

    static Result<StyleSheet> fromYaml(const YAML::Node& node);

    void define(std::string name, SegmentStyle style);
    bool remove(std::string_view name);

    const SegmentStyle* find(std::string_view name) const;

    size_t size() const { return _styles.size(); }
    bool empty() const { return _styles.empty(); }

private:
    std::map<std::string, SegmentStyle, std::less<>> _styles;
};

} // namespace richsdf
