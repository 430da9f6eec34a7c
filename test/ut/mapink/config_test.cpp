//=============================================================================
// Config tests
//
// Defaults, file, MAPINK_* environment and command line precedence.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <mapink/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace boost::ut;
using namespace mapink;

namespace {

namespace fs = std::filesystem;

// Isolated XDG home so a user config never leaks into the tests
fs::path testDir() {
    auto dir = fs::temp_directory_path() / "mapink-config-test";
    fs::create_directories(dir);
    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    return dir;
}

fs::path writeConfig(const std::string& name, const std::string& content) {
    auto path = testDir() / name;
    std::ofstream(path) << content;
    return path;
}

} // namespace

suite config_tests = [] {
    "defaults are present"_test = [] {
        testDir();
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->strokeWidth() == 5.0f);
        expect((*config)->fontSize() == 16.0f);
        expect((*config)->mapName() == "regular-main-branch");
        expect((*config)->logLevel() == "info");
        expect((*config)->logFile().empty());
        expect((*config)->has(Config::KEY_MAP_NAME));
        expect(!(*config)->has("drawing/unknown"));
    };

    "env var names follow the path"_test = [] {
        expect(Config::pathToEnvVar("drawing/stroke-width") == "MAPINK_DRAWING_STROKE_WIDTH");
        expect(Config::pathToEnvVar("log/level") == "MAPINK_LOG_LEVEL");
    };

    "xdg path honors XDG_CONFIG_HOME"_test = [] {
        auto dir = testDir();
        expect(Config::getXDGConfigPath() == dir / "mapink" / "config.yaml");
    };

    "file values override defaults"_test = [] {
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        auto path = writeConfig("file.yaml", "drawing:\n  stroke-width: 10\n  map-name: other\n");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect((*config)->strokeWidth() == 10.0f);
        expect((*config)->mapName() == "other");
        expect((*config)->fontSize() == 16.0f);
    };

    "xdg file is picked up"_test = [] {
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        auto dir = testDir();
        fs::create_directories(dir / "mapink");
        std::ofstream(dir / "mapink" / "config.yaml") << "log:\n  level: debug\n";
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->logLevel() == "debug");
        fs::remove(dir / "mapink" / "config.yaml");
    };

    "environment overrides file"_test = [] {
        auto path = writeConfig("env.yaml", "drawing:\n  stroke-width: 10\n");
        setenv("MAPINK_DRAWING_STROKE_WIDTH", "15", 1);
        auto config = Config::create(path.string());
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        expect(config.has_value() >> fatal);
        expect((*config)->strokeWidth() == 15.0f);
    };

    "command line overrides environment"_test = [] {
        auto path = writeConfig("cmd.yaml", "drawing:\n  stroke-width: 10\n");
        setenv("MAPINK_DRAWING_STROKE_WIDTH", "15", 1);
        YAML::Node overrides;
        overrides["drawing"]["stroke-width"] = 2;
        auto config = Config::create(path.string(), overrides);
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        expect(config.has_value() >> fatal);
        expect((*config)->strokeWidth() == 2.0f);
        expect((*config)->mapName() == "regular-main-branch");
    };

    "missing explicit file fails"_test = [] {
        testDir();
        auto config = Config::create("/nonexistent/mapink/config.yaml");
        expect(!config.has_value());
    };

    "broken explicit file fails"_test = [] {
        auto path = writeConfig("broken.yaml", "drawing: [unclosed\n");
        expect(!Config::create(path.string()).has_value());
    };

    "broken xdg file is skipped"_test = [] {
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        auto dir = testDir();
        fs::create_directories(dir / "mapink");
        std::ofstream(dir / "mapink" / "config.yaml") << "drawing: [unclosed\n";
        auto config = Config::create();
        fs::remove(dir / "mapink" / "config.yaml");
        expect(config.has_value() >> fatal);
        expect((*config)->strokeWidth() == 5.0f);
    };

    "typed get falls back on mismatch"_test = [] {
        auto path = writeConfig("typed.yaml", "drawing:\n  stroke-width: wide\n");
        unsetenv("MAPINK_DRAWING_STROKE_WIDTH");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect(!(*config)->get<float>(Config::KEY_STROKE_WIDTH).has_value());
        expect((*config)->get<float>(Config::KEY_STROKE_WIDTH, 7.0f) == 7.0f);
    };
};
