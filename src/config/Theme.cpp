#include "config/Theme.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace hue::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

}  // namespace

Theme::Theme(std::string name, std::filesystem::path path, std::vector<ThemeAttribute> attributes)
    : name_(std::move(name)), path_(std::move(path)), attributes_(std::move(attributes)) {}

std::optional<std::string> Theme::get(std::string_view attribute) const {
    for (auto it = attributes_.rbegin(); it != attributes_.rend(); ++it) {
        if (it->first == attribute) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<ThemeAttribute>> ThemeLoader::parse(std::istream& in, const std::string& source) {
    std::vector<ThemeAttribute> attributes;
    std::string line, current_section;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            util::Logger::error("ThemeLoader: " + source + ":" + std::to_string(line_number) +
                                ": expected 'name = value', got '" + line + "'");
            return std::nullopt;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            util::Logger::error("ThemeLoader: " + source + ":" + std::to_string(line_number) + ": empty attribute name");
            return std::nullopt;
        }

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (!current_section.empty()) {
            key = current_section + "." + key;
        }
        attributes.emplace_back(std::move(key), std::move(value));
    }

    if (in.bad()) {
        util::Logger::error("ThemeLoader: Read error on " + source);
        return std::nullopt;
    }
    return attributes;
}

std::optional<Theme> ThemeLoader::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        util::Logger::error("ThemeLoader: Cannot access theme file " + path.string() +
                            (ec ? ": " + ec.message() : std::string(": does not exist")));
        return std::nullopt;
    }
    if (std::filesystem::is_directory(status)) {
        util::Logger::error("ThemeLoader: Not a theme file: " + path.string());
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file) {
        util::Logger::error("ThemeLoader: Failed to open theme file: " + path.string());
        return std::nullopt;
    }

    auto attributes = parse(file, path.string());
    if (!attributes) {
        return std::nullopt;
    }

    util::Logger::debug("ThemeLoader: Loaded " + std::to_string(attributes->size()) + " attributes from " + path.string());
    return Theme(path.filename().string(), path, std::move(*attributes));
}

std::optional<Theme> ThemeLoader::load_from_string(const std::string& name, const std::string& content) {
    std::istringstream in(content);
    auto attributes = parse(in, name);
    if (!attributes) {
        return std::nullopt;
    }
    return Theme(name, std::filesystem::path(), std::move(*attributes));
}

}  // namespace hue::config
