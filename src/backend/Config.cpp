#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

namespace hue::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") out = true;
    else if (value == "false") out = false;
    else util::Logger::warn("Config: Ignoring non-boolean value for " + key + ": " + value);
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file found, using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from file " + path.string());

    Config cfg;

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Error reading config file: " + path.string());
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Skipping malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "themes") {
            if (key == "default_theme") cfg.default_theme = value;
            else if (key == "themes_dir") cfg.themes_dir = value;
            else if (key == "manifest_file") cfg.manifest_file = value;
            else if (key == "validate_on_load") parse_bool(key, value, cfg.validate_on_load);
        }
        else if (current_section == "logging") {
            if (key == "log_file") cfg.log_file = value;
        }
        else if (current_section == "render") {
            if (key == "mode") {
                try {
                    cfg.mode = ui::parse_theme_mode(value);
                } catch (const ui::InvalidTheme& e) {
                    util::Logger::warn(std::string("Config: ") + e.what() + " Keeping default.");
                }
            }
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Failed to open config file for writing: " + path.string());
        return false;
    }

    file << "# hue configuration\n\n";

    file << "[themes]\n";
    file << "# Theme file loaded when no --theme is given\n";
    file << "default_theme = \"" << cfg.default_theme << "\"\n";
    file << "# Directory holding theme files and the MANIFEST\n";
    file << "themes_dir = \"" << cfg.themes_dir.string() << "\"\n";
    file << "manifest_file = \"" << cfg.manifest_file << "\"\n";
    file << "# Check the default theme against the MANIFEST before loading\n";
    file << "validate_on_load = " << (cfg.validate_on_load ? "true" : "false") << "\n\n";

    file << "[logging]\n";
    file << "log_file = \"" << cfg.log_file.string() << "\"\n\n";

    file << "[render]\n";
    file << "# Default colors for previews: \"dark\" or \"light\"\n";
    file << "mode = \"" << ui::theme_mode_name(cfg.mode) << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::manifest_path(const Config& cfg) {
    return cfg.themes_dir / cfg.manifest_file;
}

std::filesystem::path ConfigLoader::default_theme_path(const Config& cfg) {
    return cfg.themes_dir / cfg.default_theme;
}

std::filesystem::path ConfigLoader::get_config_file() {
    std::filesystem::path local = "hue.config";
    std::error_code ec;
    if (std::filesystem::exists(local, ec)) {
        return local;
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "hue" / "hue.config";
    }
    return local;
}

}  // namespace hue::backend
