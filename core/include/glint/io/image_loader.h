#pragma once

/**
 * @file image_loader.h
 * @brief Decode image files into RGBA8 pixels
 *
 * Backed by stb_image (PNG, JPG, BMP, TGA, GIF, PNM). Failures are reported
 * on stderr and return an empty ImageData; callers fall back to a plain
 * texture.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace glint::io {

/// Result of loading an 8-bit image
struct ImageData {
    std::vector<uint8_t> pixels;  ///< RGBA, row-major, top row first
    int width = 0;
    int height = 0;
    int channels = 0;             ///< Channels in the file before forced RGBA

    bool valid() const { return !pixels.empty() && width > 0 && height > 0; }
};

/// @return ImageData with RGBA pixels, or empty ImageData on failure
ImageData loadImage(const std::string& path);

/// Check if a file exists and is a regular file
bool fileExists(const std::string& path);

} // namespace glint::io
