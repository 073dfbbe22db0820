#pragma once

#include "ui/Color.hpp"
#include <filesystem>
#include <string>

namespace hue::backend {

struct Config {
    // Theme settings
    std::string default_theme = "monokai";
    std::filesystem::path themes_dir = "themes.d";
    std::string manifest_file = "MANIFEST";
    bool validate_on_load = true;

    // Logging
    std::filesystem::path log_file = "theme.log";

    // Rendering
    ui::ThemeMode mode = ui::ThemeMode::Dark;
};

class ConfigLoader {
public:
    // ./hue.config, then ~/.config/hue/hue.config, then defaults
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path manifest_path(const Config& cfg);
    static std::filesystem::path default_theme_path(const Config& cfg);

    static std::filesystem::path get_config_file();
};

}  // namespace hue::backend
