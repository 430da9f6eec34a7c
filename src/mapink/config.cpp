#include <mapink/config.h>
#include <mapink/palette.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace mapink {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Merge source into target, maps recursively, scalars and sequences replace
static void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        auto key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {
        loadDefaults();
    }

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        if (!_configPath.empty()) {
            if (auto res = loadFile(_configPath); !res) {
                return Err("Failed to load config file " + _configPath, res);
            }
            yinfo("Loaded config from: {}", _configPath);
        } else {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                if (auto res = loadFile(xdgPath.string()); !res) {
                    ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
                } else {
                    yinfo("Loaded config from: {}", xdgPath.string());
                }
            }
        }

        applyEnvOverrides(_root, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_root, _cmdOverrides);
        }
        return Ok();
    }

    bool has(const std::string& path) const override {
        YAML::Node node = getNode(path);
        return node.IsDefined() && !node.IsNull();
    }

    YAML::Node root() const override { return YAML::Clone(_root); }

protected:
    YAML::Node getNode(const std::string& path) const override {
        const YAML::Node& top = _root;
        YAML::Node current;
        current.reset(top);
        for (const auto& part : splitPath(path)) {
            if (!current.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
            const YAML::Node& parent = current;
            YAML::Node next = parent[part];
            if (!next) return YAML::Node(YAML::NodeType::Undefined);
            current.reset(next);
        }
        return current;
    }

private:
    void loadDefaults() {
        _root["drawing"]["stroke-width"] = DEFAULT_STROKE_WIDTH;
        _root["drawing"]["font-size"] = DEFAULT_FONT_SIZE;
        _root["drawing"]["map-name"] = "regular-main-branch";
        _root["log"]["level"] = "info";
        _root["log"]["file"] = "";
    }

    Result<void> loadFile(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return Err<void>("Cannot open config file: " + path);
            }
            YAML::Node fileConfig = YAML::Load(file);
            if (fileConfig && !fileConfig.IsNull()) {
                if (!fileConfig.IsMap()) {
                    return Err<void>("Config file is not a mapping: " + path);
                }
                mergeNodes(_root, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    // Only keys that already exist can be overridden from the environment
    void applyEnvOverrides(YAML::Node node, const std::string& prefix) {
        std::vector<std::pair<std::string, std::string>> overrides;
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto key = it->first.as<std::string>();
            std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

            if (it->second.IsMap()) {
                applyEnvOverrides(it->second, fullPath);
                continue;
            }

            auto envVar = pathToEnvVar(fullPath);
            if (const char* val = std::getenv(envVar.c_str())) {
                ydebug("Config override from {}: {}", envVar, val);
                overrides.emplace_back(key, val);
            }
        }
        for (const auto& [key, value] : overrides) {
            node[key] = value;
        }
    }

    std::string _configPath;
    YAML::Node _cmdOverrides;
    YAML::Node _root{YAML::NodeType::Map};
};

// ─── Config ──────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok<Ptr>(config);
}

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "mapink" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "mapink" / "config.yaml";
    }
    return {};
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

float Config::strokeWidth() const {
    return get<float>(KEY_STROKE_WIDTH, DEFAULT_STROKE_WIDTH);
}

float Config::fontSize() const {
    return get<float>(KEY_FONT_SIZE, DEFAULT_FONT_SIZE);
}

std::string Config::mapName() const {
    return get<std::string>(KEY_MAP_NAME, "regular-main-branch");
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

std::string Config::logFile() const {
    return get<std::string>(KEY_LOG_FILE, "");
}

} // namespace mapink
