#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <boost/json.hpp>

namespace warden {

constexpr const char* kSha256Prefix = "sha256:";
constexpr size_t kHashChunkBytes = 8192;

// "sha256:" + hex(SHA256(canonicalBytes(value, ASCII_ESCAPED)))
std::string contentHash(const boost::json::value& value);

// Structured files hash their parsed canonical form, so whitespace and
// key order never change identity. Everything else hashes raw bytes.
std::string fileHash(const std::filesystem::path& path);

std::string dataFileHash(const std::filesystem::path& path);

std::string rawFileHash(const std::filesystem::path& path);

// Strips an optional "<algo>:" prefix.
std::string normalizeHash(std::string_view value);

// False when either side is empty; never vacuously true.
bool verifyHash(
    std::string_view expected,
    std::string_view actual
) noexcept;

}
