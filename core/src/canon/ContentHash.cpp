#include "warden/canon/ContentHash.hpp"
#include "warden/canon/Canonical.hpp"
#include "warden/canon/DataFile.hpp"
#include "warden/canon/Digest.hpp"

#include <fstream>
#include <vector>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

std::string contentHash(const json::value& value) {
    return std::string(kSha256Prefix) +
           sha256Hex(canonicalBytes(value, CanonicalPolicy::ASCII_ESCAPED));
}

std::string dataFileHash(const fs::path& path) {
    return contentHash(loadDataFile(path));
}

std::string rawFileHash(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw DataFileError("Cannot open file: " + path.string());
    }

    Sha256Stream digest;
    std::vector<char> chunk(kHashChunkBytes);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize n = in.gcount();
        if (n > 0) {
            digest.update(chunk.data(), static_cast<size_t>(n));
        }
    }
    if (in.bad()) {
        throw DataFileError("Failed reading file: " + path.string());
    }

    return std::string(kSha256Prefix) + digest.finalHex();
}

std::string fileHash(const fs::path& path) {
    if (isStructuredDataFile(path)) {
        return dataFileHash(path);
    }
    return rawFileHash(path);
}

std::string normalizeHash(std::string_view value) {
    const size_t colon = value.find(':');
    if (colon == std::string_view::npos) {
        return std::string(value);
    }
    return std::string(value.substr(colon + 1));
}

bool verifyHash(
    std::string_view expected,
    std::string_view actual
) noexcept {
    if (expected.empty() || actual.empty()) return false;

    const size_t ec = expected.find(':');
    const size_t ac = actual.find(':');
    const std::string_view e =
        ec == std::string_view::npos ? expected : expected.substr(ec + 1);
    const std::string_view a =
        ac == std::string_view::npos ? actual : actual.substr(ac + 1);

    if (e.empty() || a.empty()) return false;
    return e == a;
}

}
