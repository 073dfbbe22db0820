#include "ui/Color.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace hue::ui {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

double parse_number(std::string_view field, std::string_view input) {
    field = trim(field);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (field.empty() || ec != std::errc() || ptr != field.data() + field.size() || !std::isfinite(value)) {
        throw InvalidColorFormat(std::format("Invalid HSL component '{}' in '{}'", field, input));
    }
    return value;
}

double parse_percent(std::string_view field, std::string_view input) {
    field = trim(field);
    if (field.empty() || field.back() != '%') {
        throw InvalidColorFormat(std::format("Expected a percentage, got '{}' in '{}'", field, input));
    }
    double value = parse_number(field.substr(0, field.size() - 1), input);
    if (value < 0.0 || value > 100.0) {
        throw InvalidColorFormat(std::format("Percentage out of range [0,100] in '{}'", input));
    }
    return value / 100.0;
}

double hue_channel(double m1, double m2, double hue) {
    constexpr double one_sixth = 1.0 / 6.0;
    constexpr double two_thirds = 2.0 / 3.0;

    // Floor-modulo: negative hues wrap around
    hue = std::fmod(hue, 1.0);
    if (hue < 0.0) hue += 1.0;

    if (hue < one_sixth) return m1 + (m2 - m1) * hue * 6.0;
    if (hue < 0.5) return m2;
    if (hue < two_thirds) return m1 + (m2 - m1) * (two_thirds - hue) * 6.0;
    return m1;
}

uint8_t to_channel(double unit) {
    // Truncate, don't round
    int v = static_cast<int>(unit * 255);
    if (v < 0) v = 0;
    if (v > 255) v = 255;
    return static_cast<uint8_t>(v);
}

}  // namespace

void hls_to_rgb(double h, double l, double s, double& r, double& g, double& b) {
    if (s == 0.0) {
        r = g = b = l;
        return;
    }
    double m2 = (l <= 0.5) ? l * (1.0 + s) : (l + s - (l * s));
    double m1 = 2.0 * l - m2;
    r = hue_channel(m1, m2, h + 1.0 / 3.0);
    g = hue_channel(m1, m2, h);
    b = hue_channel(m1, m2, h - 1.0 / 3.0);
}

Rgb parse_hex(std::string_view text) {
    if (text.empty() || text.front() != '#') {
        throw InvalidColorFormat(std::format("Invalid HEX color format: '{}'", text));
    }
    // Any run of leading '#' is accepted: "##fff" == "#fff"
    auto start = text.find_first_not_of('#');
    std::string_view digits = (start == std::string_view::npos) ? std::string_view() : text.substr(start);

    int nibbles[6];
    for (size_t i = 0; i < digits.size() && i < 6; ++i) {
        nibbles[i] = hex_digit(digits[i]);
        if (nibbles[i] < 0) {
            throw InvalidColorFormat(std::format("Invalid HEX color format: '{}'", text));
        }
    }

    if (digits.size() == 6) {
        return {
            static_cast<uint8_t>(nibbles[0] * 16 + nibbles[1]),
            static_cast<uint8_t>(nibbles[2] * 16 + nibbles[3]),
            static_cast<uint8_t>(nibbles[4] * 16 + nibbles[5])
        };
    }
    if (digits.size() == 3) {
        return {
            static_cast<uint8_t>(nibbles[0] * 17),
            static_cast<uint8_t>(nibbles[1] * 17),
            static_cast<uint8_t>(nibbles[2] * 17)
        };
    }
    throw InvalidColorFormat(std::format("Invalid HEX color format: '{}'", text));
}

Rgb parse_hsl(std::string_view text) {
    constexpr std::string_view prefix = "hsl(";
    if (!text.starts_with(prefix) || !text.ends_with(')')) {
        throw InvalidColorFormat(std::format("Invalid HSL color format: '{}'", text));
    }

    std::string_view body = text.substr(prefix.size(), text.size() - prefix.size() - 1);
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (true) {
        auto comma = body.find(',', pos);
        fields.push_back(body.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    if (fields.size() != 3) {
        throw InvalidColorFormat(std::format("HSL needs exactly three components: '{}'", text));
    }

    double h = parse_number(fields[0], text);
    double s = parse_percent(fields[1], text);
    double l = parse_percent(fields[2], text);

    double r = 0.0, g = 0.0, b = 0.0;
    hls_to_rgb(h / 360.0, l, s, r, g, b);
    return {to_channel(r), to_channel(g), to_channel(b)};
}

Rgb parse_color(std::string_view text) {
    if (text.starts_with('#')) {
        return parse_hex(text);
    }
    if (text.starts_with("hsl(")) {
        return parse_hsl(text);
    }
    throw InvalidColorFormat(std::format("Unsupported color format '{}'. Use HEX or HSL.", text));
}

std::string to_hex(Rgb color) {
    return std::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

ThemeMode parse_theme_mode(std::string_view name) {
    if (name == "dark") return ThemeMode::Dark;
    if (name == "light") return ThemeMode::Light;
    throw InvalidTheme(std::format("Unsupported theme '{}'. Use 'dark' or 'light'.", name));
}

std::string_view theme_mode_name(ThemeMode mode) {
    switch (mode) {
        case ThemeMode::Dark:  return "dark";
        case ThemeMode::Light: return "light";
    }
    throw InvalidTheme("Unknown theme mode");
}

} // namespace hue::ui
