#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hue::ui {

// 24-bit truecolor value
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const = default;
};

enum class ThemeMode : uint8_t {
    Dark,
    Light
};

class InvalidColorFormat : public std::invalid_argument {
public:
    explicit InvalidColorFormat(const std::string& msg) : std::invalid_argument(msg) {}
};

class InvalidColorSpec : public std::invalid_argument {
public:
    explicit InvalidColorSpec(const std::string& msg) : std::invalid_argument(msg) {}
};

class InvalidTheme : public std::invalid_argument {
public:
    explicit InvalidTheme(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * Parse "#RGB" or "#RRGGBB" (case-insensitive).
 * Shorthand nibbles are duplicated: "#fa0" == "#ffaa00".
 * Throws InvalidColorFormat on anything else.
 */
Rgb parse_hex(std::string_view text);

/**
 * Parse "hsl(H,S%,L%)": H in degrees, S and L in [0,100] percent.
 * Channels are scaled by 255 and truncated toward zero, so
 * "hsl(0,100%,50%)" -> (255,0,0).
 * Throws InvalidColorFormat on anything else.
 */
Rgb parse_hsl(std::string_view text);

// Dispatches on the "#" / "hsl(" prefix.
Rgb parse_color(std::string_view text);

// HLS -> RGB on unit floats (h wraps into [0,1)), each channel in [0,1].
void hls_to_rgb(double h, double l, double s, double& r, double& g, double& b);

// "#rrggbb"
std::string to_hex(Rgb color);

// Exact "dark" / "light". Throws InvalidTheme otherwise.
ThemeMode parse_theme_mode(std::string_view name);
std::string_view theme_mode_name(ThemeMode mode);

} // namespace hue::ui
