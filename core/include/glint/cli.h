// Glint CLI
// Handles: glint [script] [options], glint --help, glint --version

#pragma once

#include <glint/config.h>

namespace glint::cli {

// Version info
constexpr const char* VERSION = GLINT_VERSION;

// Fill config from the config file (if given) and then the command line flags
// Returns: 0+ = handled (exit with this code), -1 = config ready (continue to main)
int parseArgs(int argc, char** argv, AppConfig& config);

// Parse "1280x720"; returns false on a malformed or non-positive size
bool parseWindowSize(const std::string& text, int& width, int& height);

} // namespace glint::cli
