// Glint CLI Implementation

#include <glint/cli.h>
#include <CLI/CLI.hpp>
#include <iostream>

namespace glint::cli {

bool parseWindowSize(const std::string& text, int& width, int& height) {
    size_t x = text.find_first_of("xX");
    if (x == std::string::npos || x == 0 || x + 1 >= text.size()) {
        return false;
    }
    try {
        size_t usedW = 0, usedH = 0;
        int w = std::stoi(text.substr(0, x), &usedW);
        int h = std::stoi(text.substr(x + 1), &usedH);
        if (usedW != x || usedH != text.size() - x - 1 || w <= 0 || h <= 0) {
            return false;
        }
        width = w;
        height = h;
        return true;
    } catch (const std::logic_error&) {
        // stoi throws invalid_argument / out_of_range
        return false;
    }
}

int parseArgs(int argc, char** argv, AppConfig& config) {
    CLI::App app{"Glint - Real-time 2D renderer for runtime-driven scenes"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    std::string scriptPath;
    std::string configPath;
    std::string windowSize;
    int port = 0;
    int linesPerTick = 0;
    int frames = 0;

    auto* scriptOpt = app.add_option("script", scriptPath, "Event script to replay");
    auto* configOpt = app.add_option("-c,--config", configPath, "JSON config file")
                          ->check(CLI::ExistingFile);
    auto* windowOpt = app.add_option("--window", windowSize, "Window size as WxH (e.g. 1280x720)");
    auto* blurFlag = app.add_flag("--blur", "Enable the separable blur post-process");
    auto* noBlurFlag = app.add_flag("--no-blur", "Disable blur even if the config enables it")
                           ->excludes(blurFlag);
    auto* wsOpt = app.add_option("--websocket", port, "Accept the runtime over WebSocket on PORT")
                      ->check(CLI::Range(1, 65535));
    auto* stdinFlag = app.add_flag("--stdin", "Read runtime lines from stdin")
                          ->excludes(wsOpt);
    auto* ltOpt = app.add_option("--lines-per-tick", linesPerTick,
                                 "Script lines released per frame (0 = all at once)")
                      ->check(CLI::NonNegativeNumber);
    auto* framesOpt = app.add_option("--frames", frames, "Exit after N frames")
                          ->check(CLI::NonNegativeNumber);
    auto* headlessFlag = app.add_flag("--headless", "Run the scene tick without a window");
    auto* noVsyncFlag = app.add_flag("--no-vsync", "Present without waiting for vblank");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        if (configOpt->count() > 0) {
            loadConfigFile(config, configPath);
        }

        if (scriptOpt->count() > 0) {
            config.scriptPath = scriptPath;
            config.runtime = RuntimeKind::Script;
        }
        if (windowOpt->count() > 0 &&
            !parseWindowSize(windowSize, config.windowWidth, config.windowHeight)) {
            throw ConfigError("--window expects WxH with positive sizes, got '" + windowSize + "'");
        }
        if (blurFlag->count() > 0) config.blur = true;
        if (noBlurFlag->count() > 0) config.blur = false;
        if (stdinFlag->count() > 0) config.runtime = RuntimeKind::Stdin;
        if (wsOpt->count() > 0) {
            config.runtime = RuntimeKind::WebSocket;
            config.port = port;
        }
        if (ltOpt->count() > 0) config.linesPerTick = linesPerTick;
        if (framesOpt->count() > 0) config.maxFrames = frames;
        if (headlessFlag->count() > 0) config.headless = true;
        if (noVsyncFlag->count() > 0) config.vsync = false;

        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return -1;
}

} // namespace glint::cli
