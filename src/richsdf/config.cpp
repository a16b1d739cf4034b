#include <richsdf/config.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace richsdf {

namespace {

// Keys that may be overridden from the environment
constexpr const char* ENV_KEYS[] = {
    Config::KEY_ATLAS_PAGE_SIZE,
    Config::KEY_ATLAS_MAX_PAGES,
    Config::KEY_ATLAS_PADDING,
    Config::KEY_ATLAS_SIZE_QUANTUM,
    Config::KEY_ATLAS_SUBPIXEL_BUCKETS,
    Config::KEY_ATLAS_MAX_EMPTY_ENTRIES,
    Config::KEY_SDF_PIXEL_RANGE,
    Config::KEY_SDF_MARGIN,
    Config::KEY_TEXT_SIZE,
    Config::KEY_TEXT_FONT,
    Config::KEY_TEXT_LINE_HEIGHT,
    Config::KEY_TEXT_TAB_WIDTH,
    Config::KEY_TEXT_FALLBACK_GLYPH,
    Config::KEY_TEXT_STROKE,
    Config::KEY_TEXT_STROKE_COLOR,
    Config::KEY_FONTS_PATHS,
};

// Walk a const node; const operator[] never inserts
YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return lookup(child, parts, i + 1);
}

void assign(YAML::Node node, const std::vector<std::string>& parts, size_t i,
            const YAML::Node& value) {
    if (i + 1 == parts.size()) {
        node[parts[i]] = value;
        return;
    }
    if (!node[parts[i]].IsMap()) {
        node[parts[i]] = YAML::Node(YAML::NodeType::Map);
    }
    assign(node[parts[i]], parts, i + 1, value);
}

} // namespace

Config::Config(std::string configPath, YAML::Node cmdOverrides) noexcept
    : _config(YAML::NodeType::Map),
      _configPath(std::move(configPath)),
      _cmdOverrides(std::move(cmdOverrides)) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::fromString(const std::string& yaml) noexcept {
    auto config = Ptr(new Config("", YAML::Node()));
    try {
        YAML::Node parsed = YAML::Load(yaml);
        if (parsed.IsMap()) {
            mergeNodes(config->_config, parsed);
        } else if (parsed.IsDefined() && !parsed.IsNull()) {
            return Err<Ptr>("Config: document root must be a map", ErrorCode::Config);
        }
    } catch (const YAML::Exception& e) {
        return Err<Ptr>(std::string("Config: YAML parse error: ") + e.what(), ErrorCode::Config);
    }
    config->applyEnvOverrides();
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
    }

    applyEnvOverrides();

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }

    ydebug("Config: initialized (file='{}')", _configPath);
    return Ok();
}

Result<void> Config::loadFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err("Config file not found: " + path, ErrorCode::Config);
    }

    try {
        YAML::Node loaded = YAML::LoadFile(path);
        if (loaded.IsMap()) {
            mergeNodes(_config, loaded);
        } else if (loaded.IsDefined() && !loaded.IsNull()) {
            return Err("Config: root of " + path + " must be a map", ErrorCode::Config);
        }
    } catch (const YAML::Exception& e) {
        return Err("Failed to parse config " + path + ": " + e.what(), ErrorCode::Config);
    }

    yinfo("Config: loaded {}", path);
    return Ok();
}

void Config::applyEnvOverrides() {
    for (const char* key : ENV_KEYS) {
        std::string envName = pathToEnvVar(key);
        const char* value = std::getenv(envName.c_str());
        if (!value) continue;
        ydebug("Config: {} overridden by {}", key, envName);
        set(key, YAML::Node(std::string(value)));
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node(YAML::NodeType::Undefined);
    return lookup(_config, parts, 0);
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

void Config::set(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;
    assign(_config, parts, 0, value);
}

std::vector<std::string> Config::getStringList(const std::string& path) const {
    std::vector<std::string> result;
    YAML::Node node = getNode(path);
    if (!node.IsDefined() || node.IsNull()) return result;

    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) result.push_back(item.as<std::string>());
        }
        return result;
    }

    if (node.IsScalar()) {
        // Colon-separated, as produced by environment overrides
        std::istringstream ss(node.as<std::string>());
        std::string item;
        while (std::getline(ss, item, ':')) {
            if (!item.empty()) result.push_back(item);
        }
    }
    return result;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string result = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            result += '_';
        } else {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

} // namespace richsdf
