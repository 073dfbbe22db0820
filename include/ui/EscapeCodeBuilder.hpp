#pragma once

#include "ui/Color.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hue::ui {

inline constexpr std::string_view kReset = "\033[0m";

/**
 * Accumulates SGR directives and renders them as a single escape sequence.
 *
 *   auto seq = EscapeCodeBuilder{ThemeMode::Light}
 *                  .set_bold()
 *                  .set_fg_color("#ffcb00")
 *                  .build();   // "\033[38;2;255;203;0;48;2;240;240;240;1m"
 *
 * A builder is a plain mutable value owned by one caller. It is not
 * synchronized; use one instance per thread.
 *
 * Style setters always append, so set_bold().set_bold(false) emits "1;22"
 * and repeated calls emit repeated tokens.
 */
class EscapeCodeBuilder {
public:
    explicit EscapeCodeBuilder(ThemeMode mode = ThemeMode::Dark);

    // No default fg/bg; only explicitly set codes are emitted.
    static EscapeCodeBuilder without_defaults();

    EscapeCodeBuilder& set_bold(bool enabled = true);
    EscapeCodeBuilder& set_italic(bool enabled = true);
    EscapeCodeBuilder& set_underline(bool enabled = true);

    // A non-empty color string wins over rgb. Throws InvalidColorSpec when
    // neither is given, InvalidColorFormat when the string doesn't parse.
    EscapeCodeBuilder& set_fg_color(const std::optional<std::string>& color,
                                    const std::optional<Rgb>& rgb = std::nullopt);
    EscapeCodeBuilder& set_fg_color(Rgb rgb);

    EscapeCodeBuilder& set_bg_color(const std::optional<std::string>& color,
                                    const std::optional<Rgb>& rgb = std::nullopt);
    EscapeCodeBuilder& set_bg_color(Rgb rgb);

    // Resets fg/bg to the mode's defaults, discarding explicit colors.
    EscapeCodeBuilder& set_theme(ThemeMode mode);
    EscapeCodeBuilder& set_theme(const std::string& name);

    EscapeCodeBuilder& set_negative(bool enabled = true);

    // Compatible rendering. In negative mode the stored fg/bg codes are
    // swapped in place before rendering, so consecutive calls alternate.
    std::string build();

    // Same sequence with the negative swap applied to a copy. Idempotent.
    std::string render() const;

    const std::optional<std::string>& fg_code() const { return fg_code_; }
    const std::optional<std::string>& bg_code() const { return bg_code_; }
    const std::vector<std::string>& styles() const { return styles_; }
    bool negative() const { return negative_; }
    ThemeMode mode() const { return mode_; }

    static Rgb default_fg(ThemeMode mode);
    static Rgb default_bg(ThemeMode mode);

private:
    struct NoDefaults {};
    explicit EscapeCodeBuilder(NoDefaults);

    void apply_default_colors();
    static Rgb resolve(const std::optional<std::string>& color, const std::optional<Rgb>& rgb);
    static std::string compose(const std::optional<std::string>& fg,
                               const std::optional<std::string>& bg,
                               const std::vector<std::string>& styles);

    std::vector<std::string> styles_;
    std::optional<std::string> fg_code_;
    std::optional<std::string> bg_code_;
    bool negative_ = false;
    ThemeMode mode_ = ThemeMode::Dark;
};

} // namespace hue::ui
