#include "ui/EscapeCodeBuilder.hpp"
#include <format>
#include <utility>

namespace hue::ui {

namespace {

std::string truecolor_code(int selector, Rgb c) {
    return std::format("{};2;{};{};{}", selector, static_cast<int>(c.r), static_cast<int>(c.g), static_cast<int>(c.b));
}

constexpr int kForeground = 38;
constexpr int kBackground = 48;

}  // namespace

EscapeCodeBuilder::EscapeCodeBuilder(ThemeMode mode) : mode_(mode) {
    apply_default_colors();
}

EscapeCodeBuilder::EscapeCodeBuilder(NoDefaults) {}

EscapeCodeBuilder EscapeCodeBuilder::without_defaults() {
    return EscapeCodeBuilder(NoDefaults{});
}

Rgb EscapeCodeBuilder::default_fg(ThemeMode mode) {
    switch (mode) {
        case ThemeMode::Dark:  return {0xe0, 0xe0, 0xe0};
        case ThemeMode::Light: return {0x2e, 0x2e, 0x2e};
    }
    throw InvalidTheme("Unknown theme mode");
}

Rgb EscapeCodeBuilder::default_bg(ThemeMode mode) {
    switch (mode) {
        case ThemeMode::Dark:  return {0x1e, 0x1e, 0x1e};
        case ThemeMode::Light: return {0xf0, 0xf0, 0xf0};
    }
    throw InvalidTheme("Unknown theme mode");
}

void EscapeCodeBuilder::apply_default_colors() {
    fg_code_ = truecolor_code(kForeground, default_fg(mode_));
    bg_code_ = truecolor_code(kBackground, default_bg(mode_));
}

EscapeCodeBuilder& EscapeCodeBuilder::set_bold(bool enabled) {
    styles_.emplace_back(enabled ? "1" : "22");
    return *this;
}

EscapeCodeBuilder& EscapeCodeBuilder::set_italic(bool enabled) {
    styles_.emplace_back(enabled ? "3" : "23");
    return *this;
}

EscapeCodeBuilder& EscapeCodeBuilder::set_underline(bool enabled) {
    styles_.emplace_back(enabled ? "4" : "24");
    return *this;
}

Rgb EscapeCodeBuilder::resolve(const std::optional<std::string>& color, const std::optional<Rgb>& rgb) {
    if (color && !color->empty()) {
        return parse_color(*color);
    }
    if (rgb) {
        return *rgb;
    }
    throw InvalidColorSpec("Invalid color specification. Provide either a color string or RGB tuple.");
}

EscapeCodeBuilder& EscapeCodeBuilder::set_fg_color(const std::optional<std::string>& color,
                                                   const std::optional<Rgb>& rgb) {
    fg_code_ = truecolor_code(kForeground, resolve(color, rgb));
    return *this;
}

EscapeCodeBuilder& EscapeCodeBuilder::set_fg_color(Rgb rgb) {
    return set_fg_color(std::nullopt, rgb);
}

EscapeCodeBuilder& EscapeCodeBuilder::set_bg_color(const std::optional<std::string>& color,
                                                   const std::optional<Rgb>& rgb) {
    bg_code_ = truecolor_code(kBackground, resolve(color, rgb));
    return *this;
}

EscapeCodeBuilder& EscapeCodeBuilder::set_bg_color(Rgb rgb) {
    return set_bg_color(std::nullopt, rgb);
}

EscapeCodeBuilder& EscapeCodeBuilder::set_theme(ThemeMode mode) {
    mode_ = mode;
    apply_default_colors();
    return *this;
}

EscapeCodeBuilder& EscapeCodeBuilder::set_theme(const std::string& name) {
    // Parse first so a bad name leaves the builder untouched
    return set_theme(parse_theme_mode(name));
}

EscapeCodeBuilder& EscapeCodeBuilder::set_negative(bool enabled) {
    negative_ = enabled;
    return *this;
}

std::string EscapeCodeBuilder::compose(const std::optional<std::string>& fg,
                                       const std::optional<std::string>& bg,
                                       const std::vector<std::string>& styles) {
    std::string joined;
    auto append = [&joined](const std::string& code) {
        if (!joined.empty()) joined += ';';
        joined += code;
    };

    if (fg) append(*fg);
    if (bg) append(*bg);
    for (const auto& code : styles) {
        append(code);
    }
    return std::format("\033[{}m", joined);
}

std::string EscapeCodeBuilder::build() {
    if (negative_) {
        std::swap(fg_code_, bg_code_);
    }
    return compose(fg_code_, bg_code_, styles_);
}

std::string EscapeCodeBuilder::render() const {
    if (negative_) {
        return compose(bg_code_, fg_code_, styles_);
    }
    return compose(fg_code_, bg_code_, styles_);
}

} // namespace hue::ui
