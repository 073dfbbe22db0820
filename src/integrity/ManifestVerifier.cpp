#include "integrity/ManifestVerifier.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace hue::integrity {

ManifestParseError::ManifestParseError(const std::filesystem::path& manifest, size_t line_number, const std::string& line)
    : std::runtime_error(std::format("{}:{}: expected '<theme file> <sha256>', got '{}'",
                                     manifest.string(), line_number, line)),
      manifest_(manifest),
      line_number_(line_number) {}

ManifestVerifier::ManifestVerifier(std::filesystem::path themes_dir)
    : themes_dir_(std::move(themes_dir)) {}

std::optional<ManifestEntry> ManifestVerifier::parse_line(const std::string& line,
                                                          const std::filesystem::path& manifest_path,
                                                          size_t line_number) {
    std::istringstream fields(line);
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
        tokens.push_back(std::move(token));
    }

    if (tokens.empty()) {
        return std::nullopt;
    }
    if (tokens.size() != 2) {
        throw ManifestParseError(manifest_path, line_number, line);
    }
    return ManifestEntry{std::move(tokens[0]), std::move(tokens[1])};
}

bool ManifestVerifier::verify(const std::filesystem::path& theme_file,
                              const std::filesystem::path& manifest_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(theme_file, ec)) {
        if (ec) {
            util::Logger::error("ManifestVerifier: Cannot access theme file " + theme_file.string() + ": " + ec.message());
        } else {
            util::Logger::warn("ManifestVerifier: Theme file " + theme_file.string() + " does not exist.");
        }
        return false;
    }

    std::ifstream manifest(manifest_path);
    if (!manifest) {
        util::Logger::error("ManifestVerifier: Error reading MANIFEST file: " + manifest_path.string());
        return false;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(manifest, line)) {
        ++line_number;
        auto entry = parse_line(line, manifest_path, line_number);
        // Plain string match: "themes.d//x" is not "themes.d/x"
        if (!entry || (themes_dir_ / entry->theme_file).native() != theme_file.native()) {
            continue;
        }

        auto actual_hash = util::ContentHasher::hash_file(theme_file);
        if (!actual_hash) {
            util::Logger::error("ManifestVerifier: Could not read theme file " + theme_file.string());
            return false;
        }
        if (*actual_hash != entry->expected_hash) {
            util::Logger::error(std::format("ManifestVerifier: Theme {} does not match expected hash (expected {}, got {})",
                                            theme_file.string(), entry->expected_hash, *actual_hash));
            return false;
        }
        util::Logger::info("ManifestVerifier: Theme " + theme_file.string() + " matches MANIFEST");
        return true;
    }

    util::Logger::warn("ManifestVerifier: Theme file " + theme_file.string() + " not found in MANIFEST.");
    return false;
}

std::vector<ManifestEntry> ManifestVerifier::parse_manifest(const std::filesystem::path& manifest_path) {
    std::vector<ManifestEntry> entries;

    std::ifstream manifest(manifest_path);
    if (!manifest) {
        util::Logger::error("ManifestVerifier: Error reading MANIFEST file: " + manifest_path.string());
        return entries;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(manifest, line)) {
        ++line_number;
        if (auto entry = parse_line(line, manifest_path, line_number)) {
            entries.push_back(std::move(*entry));
        }
    }

    util::Logger::debug("ManifestVerifier: Parsed " + std::to_string(entries.size()) + " entries from " + manifest_path.string());
    return entries;
}

std::optional<std::string> ManifestVerifier::manifest_line(const std::filesystem::path& theme_file) {
    auto digest = util::ContentHasher::hash_file(theme_file);
    if (!digest) {
        return std::nullopt;
    }
    return theme_file.filename().string() + " " + *digest;
}

}  // namespace hue::integrity
