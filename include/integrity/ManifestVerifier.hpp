#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hue::integrity {

struct ManifestEntry {
    std::string theme_file;     // Relative to the themes directory
    std::string expected_hash;  // Lowercase hex SHA-256
};

// A non-blank manifest line that isn't exactly "<file> <hash>".
class ManifestParseError : public std::runtime_error {
public:
    ManifestParseError(const std::filesystem::path& manifest, size_t line_number, const std::string& line);

    const std::filesystem::path& manifest() const { return manifest_; }
    size_t line_number() const { return line_number_; }

private:
    std::filesystem::path manifest_;
    size_t line_number_;
};

/**
 * Checks theme files against a MANIFEST of SHA-256 digests.
 *
 * Manifest format, one entry per line, blank lines ignored:
 *   monokai      3f2a...e9   (64 lowercase hex chars)
 *
 * The manifest is re-read on every call. Missing files, an unreadable
 * manifest, a digest mismatch or an unlisted theme all return false and
 * are logged; a malformed line throws ManifestParseError.
 */
class ManifestVerifier {
public:
    explicit ManifestVerifier(std::filesystem::path themes_dir);

    bool verify(const std::filesystem::path& theme_file, const std::filesystem::path& manifest_path) const;

    const std::filesystem::path& themes_dir() const { return themes_dir_; }

    static std::vector<ManifestEntry> parse_manifest(const std::filesystem::path& manifest_path);

    // "<filename> <digest>", ready to append to a manifest
    static std::optional<std::string> manifest_line(const std::filesystem::path& theme_file);

private:
    // Returns std::nullopt for blank lines
    static std::optional<ManifestEntry> parse_line(const std::string& line,
                                                   const std::filesystem::path& manifest_path,
                                                   size_t line_number);

    std::filesystem::path themes_dir_;
};

}  // namespace hue::integrity
