/**
 * @file test_config.cpp
 * @brief Unit tests for JSON config loading and command line parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <glint/cli.h>
#include <glint/config.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace glint;

namespace {

std::string fixture(const std::string& name) {
    return std::string(GLINT_TEST_FIXTURES) + "/configs/" + name;
}

// CLI11 wants a mutable argv
int runArgs(std::vector<std::string> args, AppConfig& config) {
    args.insert(args.begin(), "glint");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return cli::parseArgs(static_cast<int>(argv.size()), argv.data(), config);
}

} // namespace

TEST_CASE("Default config", "[config]") {
    AppConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.runtime == RuntimeKind::Script);
    REQUIRE(config.linesPerTick == 0);
    REQUIRE_FALSE(config.blur);
}

TEST_CASE("Config file", "[config]") {
    AppConfig config;

    SECTION("every key is applied") {
        loadConfigFile(config, fixture("full.json"));
        REQUIRE(config.windowWidth == 800);
        REQUIRE(config.windowHeight == 600);
        REQUIRE(config.windowTitle == "Glint Test");
        REQUIRE(config.blur);
        REQUIRE_FALSE(config.vsync);
        REQUIRE(config.clearColor == Color(0.0f, 0.0f, 0.0f, 1.0f));
        REQUIRE(config.runtime == RuntimeKind::WebSocket);
        REQUIRE(config.port == 9100);
        REQUIRE(config.linesPerTick == 2);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(loadConfigFile(config, fixture("does_not_exist.json")), ConfigError);
    }

    SECTION("truncated JSON") {
        REQUIRE_THROWS_AS(loadConfigFile(config, fixture("broken.json")), ConfigError);
    }

    SECTION("wrong value type") {
        REQUIRE_THROWS_AS(loadConfigFile(config, fixture("wrong_type.json")), ConfigError);
    }
}

TEST_CASE("Config JSON overlay", "[config]") {
    AppConfig config;

    SECTION("absent keys keep their values") {
        applyConfigJson(config, nlohmann::json::parse(R"({"blur": true})"));
        REQUIRE(config.blur);
        REQUIRE(config.windowWidth == 1280);
    }

    SECTION("runtime type aliases") {
        applyConfigJson(config, nlohmann::json::parse(R"({"runtime": {"type": "stdio"}})"));
        REQUIRE(config.runtime == RuntimeKind::Stdin);
    }

    SECTION("unknown runtime type") {
        auto j = nlohmann::json::parse(R"({"runtime": {"type": "carrier-pigeon"}})");
        REQUIRE_THROWS_AS(applyConfigJson(config, j), ConfigError);
    }

    SECTION("bad clear color") {
        auto j = nlohmann::json::parse(R"({"clearColor": [1, 0]})");
        REQUIRE_THROWS_AS(applyConfigJson(config, j), ConfigError);
    }

    SECTION("root must be an object") {
        REQUIRE_THROWS_AS(applyConfigJson(config, nlohmann::json::parse("[1, 2]")), ConfigError);
    }
}

TEST_CASE("Config validation", "[config]") {
    AppConfig config;

    SECTION("window size") {
        config.windowWidth = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("lines per tick") {
        config.linesPerTick = -1;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("port only matters for websocket") {
        config.port = 0;
        REQUIRE_NOTHROW(config.validate());
        config.runtime = RuntimeKind::WebSocket;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }
}

TEST_CASE("Window size parsing", "[config][cli]") {
    int w = 1, h = 1;
    REQUIRE(cli::parseWindowSize("640x480", w, h));
    REQUIRE(w == 640);
    REQUIRE(h == 480);
    REQUIRE(cli::parseWindowSize("320X200", w, h));
    REQUIRE(w == 320);

    REQUIRE_FALSE(cli::parseWindowSize("640", w, h));
    REQUIRE_FALSE(cli::parseWindowSize("x480", w, h));
    REQUIRE_FALSE(cli::parseWindowSize("0x480", w, h));
    REQUIRE_FALSE(cli::parseWindowSize("640x48o", w, h));
    REQUIRE(w == 320);
}

TEST_CASE("Command line", "[config][cli]") {
    AppConfig config;

    SECTION("flags are applied") {
        REQUIRE(runArgs({"--window", "640x480", "--blur", "--frames", "10"}, config) == -1);
        REQUIRE(config.windowWidth == 640);
        REQUIRE(config.windowHeight == 480);
        REQUIRE(config.blur);
        REQUIRE(config.maxFrames == 10);
    }

    SECTION("positional script") {
        REQUIRE(runArgs({"demo.txt", "--lines-per-tick", "3"}, config) == -1);
        REQUIRE(config.runtime == RuntimeKind::Script);
        REQUIRE(config.scriptPath == "demo.txt");
        REQUIRE(config.linesPerTick == 3);
    }

    SECTION("websocket port") {
        REQUIRE(runArgs({"--websocket", "9000"}, config) == -1);
        REQUIRE(config.runtime == RuntimeKind::WebSocket);
        REQUIRE(config.port == 9000);
    }

    SECTION("flags override the config file") {
        REQUIRE(runArgs({"-c", fixture("full.json"), "--no-blur"}, config) == -1);
        REQUIRE(config.windowWidth == 800);
        REQUIRE_FALSE(config.blur);
    }

    SECTION("malformed window size") {
        REQUIRE(runArgs({"--window", "big"}, config) == 1);
    }

    SECTION("help exits cleanly") {
        REQUIRE(runArgs({"--help"}, config) == 0);
    }

    SECTION("stdin and websocket are exclusive") {
        REQUIRE(runArgs({"--stdin", "--websocket", "9000"}, config) > 0);
    }
}
