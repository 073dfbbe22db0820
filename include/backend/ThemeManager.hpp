#pragma once

#include "backend/Config.hpp"
#include "config/Theme.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hue::backend {

/**
 * Ties configuration, MANIFEST verification and theme loading together.
 * Callers create one from a Config and pass the resulting Theme to
 * whatever needs it; there is no process-wide theme.
 */
class ThemeManager {
public:
    explicit ThemeManager(Config cfg);

    const Config& config() const { return cfg_; }

    // Defaults to the configured default theme. ManifestParseError propagates.
    bool validate_theme(const std::optional<std::filesystem::path>& theme_file = std::nullopt) const;

    std::optional<config::Theme> get_theme_instance(
        const std::optional<std::filesystem::path>& theme_file = std::nullopt) const;

    // Validates (when validate_on_load is set) and loads the default theme
    std::optional<config::Theme> open_default_theme() const;

    // One line per attribute; color values get a swatch in the configured mode
    std::vector<std::string> preview_lines(const config::Theme& theme) const;

    static std::string describe(const config::Theme& theme);

private:
    std::filesystem::path resolve(const std::optional<std::filesystem::path>& theme_file) const;

    Config cfg_;
};

}  // namespace hue::backend
