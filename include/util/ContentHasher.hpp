#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hue::util {

class ContentHasher {
public:
    // SHA-256 of the buffer as a 64-char lowercase hex string.
    // An empty buffer hashes like any other input.
    static std::string sha256_hex(const std::vector<uint8_t>& data);
    static std::string sha256_hex(std::string_view data);

    // Reads the whole file and hashes it. std::nullopt if it can't be read.
    static std::optional<std::string> hash_file(const std::filesystem::path& path);

    static std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

    static constexpr size_t kDigestHexLength = 64;

private:
    static std::string sha256_hex(const unsigned char* data, size_t len);
    static std::string to_hex(const unsigned char* bytes, size_t len);
};

}  // namespace hue::util
