#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hue::config {

using ThemeAttribute = std::pair<std::string, std::string>;

// Parsed theme file. Immutable once loaded.
class Theme {
public:
    Theme(std::string name, std::filesystem::path path, std::vector<ThemeAttribute> attributes);

    const std::string& name() const { return name_; }
    const std::filesystem::path& path() const { return path_; }

    // Attributes in file order, duplicates included
    const std::vector<ThemeAttribute>& list_attributes() const { return attributes_; }

    // Last definition wins
    std::optional<std::string> get(std::string_view attribute) const;

    size_t size() const { return attributes_.size(); }
    bool empty() const { return attributes_.empty(); }

private:
    std::string name_;
    std::filesystem::path path_;
    std::vector<ThemeAttribute> attributes_;
};

/**
 * Theme file format:
 *
 *   # comment
 *   fg = #e0e0e0
 *   [status]
 *   warning = "hsl(40,100%,50%)"     -> attribute "status.warning"
 *
 * Missing, unreadable or malformed files yield std::nullopt (logged).
 */
class ThemeLoader {
public:
    static std::optional<Theme> load_from_file(const std::filesystem::path& path);
    static std::optional<Theme> load_from_string(const std::string& name, const std::string& content);

private:
    static std::optional<std::vector<ThemeAttribute>> parse(std::istream& in, const std::string& source);
};

}  // namespace hue::config
