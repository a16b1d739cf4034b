#pragma once

#include <richsdf/result.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace richsdf {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // File (optional) < RICHSDF_* environment < command-line overrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Build from an in-memory YAML document (tests, embedded defaults)
    static Result<Ptr> fromString(const std::string& yaml) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "atlas.page-size")
    // Returns nullopt if key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Missing or mistyped values give defaultValue
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Sequence of scalars, or a single colon-separated string
    std::vector<std::string> getStringList(const std::string& path) const;

    bool has(const std::string& path) const;

    // Set a value by dotted path, creating intermediate maps
    void set(const std::string& path, const YAML::Node& value);

    const YAML::Node& root() const { return _config; }

    // Get YAML node by dotted path (undefined node if missing)
    YAML::Node getNode(const std::string& path) const;

    // Convert dotted path to env var name (e.g., "atlas.page-size" -> "RICHSDF_ATLAS_PAGE_SIZE")
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "RICHSDF_";

    // Keys read by the library
    static constexpr const char* KEY_ATLAS_PAGE_SIZE = "atlas.page-size";
    static constexpr const char* KEY_ATLAS_MAX_PAGES = "atlas.max-pages";
    static constexpr const char* KEY_ATLAS_PADDING = "atlas.padding";
    static constexpr const char* KEY_ATLAS_SIZE_QUANTUM = "atlas.size-quantum";
    static constexpr const char* KEY_ATLAS_SUBPIXEL_BUCKETS = "atlas.subpixel-buckets";
    static constexpr const char* KEY_ATLAS_MAX_EMPTY_ENTRIES = "atlas.max-empty-entries";
    static constexpr const char* KEY_SDF_PIXEL_RANGE = "sdf.pixel-range";
    static constexpr const char* KEY_SDF_MARGIN = "sdf.margin";
    static constexpr const char* KEY_TEXT_SIZE = "text.size";
    static constexpr const char* KEY_TEXT_FONT = "text.font";
    static constexpr const char* KEY_TEXT_LINE_HEIGHT = "text.line-height";
    static constexpr const char* KEY_TEXT_TAB_WIDTH = "text.tab-width";
    static constexpr const char* KEY_TEXT_FALLBACK_GLYPH = "text.fallback-glyph";
    static constexpr const char* KEY_TEXT_STROKE = "text.stroke";
    static constexpr const char* KEY_TEXT_STROKE_COLOR = "text.stroke-color";
    static constexpr const char* KEY_FONTS_PATHS = "fonts.paths";
    static constexpr const char* KEY_STYLES = "styles";

private:
    Config(std::string configPath, YAML::Node cmdOverrides) noexcept;
    Result<void> init() noexcept;

    Result<void> loadFile(const std::string& path);

    // Apply environment variable overrides for the known keys
    void applyEnvOverrides();

    // Maps merge recursively, anything else replaces
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    static std::vector<std::string> splitPath(const std::string& path);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace richsdf
