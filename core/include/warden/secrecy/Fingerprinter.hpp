#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

#include "warden/secrecy/HashingScheme.hpp"
#include "warden/secrecy/KeyProvider.hpp"

namespace warden {

// Checked in this order; the first list-valued key wins.
constexpr const char* kItemListKeys[] = {
    "items", "examples", "prompts", "test_cases", "records"
};

// \r\n and \r become \n, then surrounding whitespace is stripped.
std::string normalizeText(std::string_view text);

// Splits on blank-line boundaries; returns stripped, non-empty paragraphs.
std::vector<std::string> splitParagraphs(std::string_view text);

// ---------------------------------------------------------------------------
// Fingerprinter
//
// One hashing scheme bound to one resolved key. For HMAC schemes the key
// is looked up at construction and a missing key throws FingerprintError,
// so no content is ever digested without it.
// ---------------------------------------------------------------------------
class Fingerprinter {
public:
    Fingerprinter(
        HashingScheme scheme,
        const KeyProvider& keys,
        const std::string& default_key_name = kDefaultHmacKeyName
    );

    const HashingScheme& scheme() const { return scheme_; }

    // digest_prefix + hex digest of payload
    std::string digest(std::string_view payload) const;

    // Unicode-preserving canonical form, then digest.
    std::string fingerprintItem(const boost::json::value& item) const;

    // nullopt when the normalized text is empty.
    std::optional<std::string> fingerprintTextBlock(std::string_view text) const;

    // Strings fingerprint as text blocks, everything else as items.
    std::vector<std::string> fingerprintValue(const boost::json::value& value) const;

    std::vector<std::string> fingerprintStructured(const boost::json::value& doc) const;
    std::vector<std::string> fingerprintJsonLines(std::string_view text) const;
    std::vector<std::string> fingerprintTextDocument(std::string_view text) const;

    // Dispatches on suffix; unsupported suffixes give no fingerprints.
    // Read and parse failures propagate.
    std::vector<std::string> fingerprintFile(const std::filesystem::path& path) const;

    static bool supportsFile(const std::filesystem::path& path);

private:
    HashingScheme scheme_;
    std::optional<std::string> key_;
};

}
