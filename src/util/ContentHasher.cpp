#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <openssl/sha.h>

namespace hue::util {

std::string ContentHasher::to_hex(const unsigned char* bytes, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string ContentHasher::sha256_hex(const unsigned char* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string ContentHasher::sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string ContentHasher::sha256_hex(std::string_view data) {
    return sha256_hex(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::optional<std::vector<uint8_t>> ContentHasher::read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::error("ContentHasher: Failed to open file for reading: " + path.string());
        return std::nullopt;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        Logger::error("ContentHasher: Read error on " + path.string());
        return std::nullopt;
    }
    return data;
}

std::optional<std::string> ContentHasher::hash_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        Logger::error("ContentHasher: Not a regular file: " + path.string());
        return std::nullopt;
    }

    auto data = read_file(path);
    if (!data) {
        return std::nullopt;
    }

    Logger::debug("ContentHasher: Hashed " + std::to_string(data->size()) + " bytes from " + path.string());
    return sha256_hex(*data);
}

}  // namespace hue::util
