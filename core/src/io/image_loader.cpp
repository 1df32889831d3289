// Glint I/O - Image Loader

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <glint/io/image_loader.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace glint::io {

ImageData loadImage(const std::string& path) {
    ImageData result;

    if (!fileExists(path)) {
        std::cerr << "[ImageLoader] Image not found: " << path << std::endl;
        return result;
    }

    // Load with stb_image, forcing RGBA output
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[ImageLoader] Failed to load image: " << path
                  << " - " << stbi_failure_reason() << std::endl;
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);

    stbi_image_free(data);
    return result;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace glint::io
