#include "backend/ThemeManager.hpp"
#include "integrity/ManifestVerifier.hpp"
#include "ui/EscapeCodeBuilder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace hue::backend {

ThemeManager::ThemeManager(Config cfg) : cfg_(std::move(cfg)) {
    util::Logger::debug("ThemeManager: themes_dir=" + cfg_.themes_dir.string() +
                        ", default_theme=" + cfg_.default_theme);
}

std::filesystem::path ThemeManager::resolve(const std::optional<std::filesystem::path>& theme_file) const {
    if (theme_file && !theme_file->empty()) {
        return *theme_file;
    }
    return ConfigLoader::default_theme_path(cfg_);
}

bool ThemeManager::validate_theme(const std::optional<std::filesystem::path>& theme_file) const {
    auto path = resolve(theme_file);
    integrity::ManifestVerifier verifier(cfg_.themes_dir);
    return verifier.verify(path, ConfigLoader::manifest_path(cfg_));
}

std::optional<config::Theme> ThemeManager::get_theme_instance(
    const std::optional<std::filesystem::path>& theme_file) const {
    auto path = resolve(theme_file);
    auto theme = config::ThemeLoader::load_from_file(path);
    if (theme) {
        util::Logger::info("Loaded theme from file: " + path.string());
    }
    return theme;
}

std::optional<config::Theme> ThemeManager::open_default_theme() const {
    if (cfg_.validate_on_load) {
        if (!validate_theme()) {
            util::Logger::error("Failed to validate theme.");
            return std::nullopt;
        }
    } else {
        util::Logger::info("Skipping theme validation as per configuration.");
    }

    auto theme = get_theme_instance();
    if (!theme) {
        util::Logger::error("Failed to load default theme.");
        return std::nullopt;
    }
    util::Logger::info("Loaded default theme.");
    return theme;
}

std::vector<std::string> ThemeManager::preview_lines(const config::Theme& theme) const {
    std::vector<std::string> lines;

    size_t width = 0;
    for (const auto& [name, value] : theme.list_attributes()) {
        width = std::max(width, name.size());
    }

    for (const auto& [name, value] : theme.list_attributes()) {
        std::string swatch = "      ";
        if (!value.empty()) {
            try {
                ui::EscapeCodeBuilder builder(cfg_.mode);
                swatch = builder.set_bg_color(value).render() + "      " + std::string(ui::kReset);
            } catch (const ui::InvalidColorFormat&) {
                util::Logger::debug("ThemeManager: " + name + " is not a color: " + value);
            }
        }
        lines.push_back(std::format("{} {:<{}}  {}", swatch, name, width, value));
    }
    return lines;
}

std::string ThemeManager::describe(const config::Theme& theme) {
    std::string out = "[";
    bool first = true;
    for (const auto& [name, value] : theme.list_attributes()) {
        if (!first) out += ", ";
        out += std::format("('{}', '{}')", name, value);
        first = false;
    }
    out += "]";
    return out;
}

}  // namespace hue::backend
