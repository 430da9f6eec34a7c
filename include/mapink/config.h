#pragma once

#include <mapink/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace mapink {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then configPath (or the XDG file), then MAPINK_* environment,
    // then cmdOverrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by slash path (e.g. "drawing/stroke-width")
    // Returns nullopt if the key doesn't exist or has another type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    virtual bool has(const std::string& path) const = 0;

    // Full merged tree
    virtual YAML::Node root() const = 0;

    // $XDG_CONFIG_HOME/mapink/config.yaml, else ~/.config/mapink/config.yaml
    static std::filesystem::path getXDGConfigPath();

    // "drawing/stroke-width" -> "MAPINK_DRAWING_STROKE_WIDTH"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "MAPINK_";

    static constexpr const char* KEY_STROKE_WIDTH = "drawing/stroke-width";
    static constexpr const char* KEY_FONT_SIZE = "drawing/font-size";
    static constexpr const char* KEY_MAP_NAME = "drawing/map-name";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";
    static constexpr const char* KEY_LOG_FILE = "log/file";

    float strokeWidth() const;
    float fontSize() const;
    std::string mapName() const;
    std::string logLevel() const;
    std::string logFile() const;

protected:
    Config() = default;

    // Node at a slash path, undefined node when missing
    virtual YAML::Node getNode(const std::string& path) const = 0;
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

} // namespace mapink
