// Glint - Color parsing

#include <glint/color.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace glint {

std::optional<Color> Color::fromHex(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s[0] == '#') {
        s = s.substr(1);
    }
    if (s.length() != 6 && s.length() != 8) {
        return std::nullopt;
    }
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    uint32_t val = static_cast<uint32_t>(std::stoul(s, nullptr, 16));
    if (s.length() == 8) {
        // 0xRRGGBBAA with a zero red channel would otherwise read as RGB
        return Color(
            ((val >> 24) & 0xFF) / 255.0f,
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f
        );
    }
    return fromHex(val);
}

std::optional<Color> Color::fromName(const std::string& name) {
    static const std::unordered_map<std::string, Color> s_named = {
        {"black", Color::Black},
        {"white", Color::White},
        {"gray", Color::Gray},
        {"grey", Color::Gray},
        {"red", Color::Red},
        {"green", Color::Green},
        {"blue", Color::Blue},
        {"yellow", Color::Yellow},
        {"cyan", Color::Cyan},
        {"magenta", Color::Magenta},
        {"orange", Color::Orange},
        {"purple", Color::Purple},
        {"pink", Color::Pink},
        {"transparent", Color::Transparent},
        // Words emitted by the Japanese-language runtime
        {"黒", Color::Black},
        {"白", Color::White},
        {"灰色", Color::Gray},
        {"赤", Color::Red},
        {"緑", Color::Green},
        {"青", Color::Blue},
        {"黄色", Color::Yellow},
        {"黄", Color::Yellow},
        {"水色", Color::Cyan},
        {"橙", Color::Orange},
        {"紫", Color::Purple},
        {"ピンク", Color::Pink},
    };

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });

    auto it = s_named.find(key);
    if (it != s_named.end()) {
        return it->second;
    }
    return fromHex(name);
}

} // namespace glint
