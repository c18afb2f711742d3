#include "warden/secrecy/Fingerprinter.hpp"
#include "warden/canon/Canonical.hpp"
#include "warden/canon/DataFile.hpp"
#include "warden/canon/Digest.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

bool isSpace(char c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
        case '\x1c': case '\x1d': case '\x1e': case '\x1f':
            return true;
        default:
            return false;
    }
}

bool isLineBreak(char c) {
    switch (c) {
        case '\n': case '\r': case '\v': case '\f':
        case '\x1c': case '\x1d': case '\x1e':
            return true;
        default:
            return false;
    }
}

// Byte length of the line break starting at s[i], or 0. Covers NEL,
// LINE SEPARATOR and PARAGRAPH SEPARATOR in their UTF-8 forms.
size_t lineBreakAt(std::string_view s, size_t i) {
    if (isLineBreak(s[i])) return 1;
    if (s.compare(i, 2, "\xc2\x85") == 0) return 2;
    if (s.compare(i, 3, "\xe2\x80\xa8") == 0) return 3;
    if (s.compare(i, 3, "\xe2\x80\xa9") == 0) return 3;
    return 0;
}

std::string_view strip(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string unifyNewlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += text[i];
        }
    }
    return out;
}

// Text read with undecodable bytes dropped and universal newlines.
std::string readCorpusText(const fs::path& path) {
    return unifyNewlines(sanitizeUtf8(readFileBytes(path)));
}

} // namespace

std::string normalizeText(std::string_view text) {
    const std::string unified = unifyNewlines(text);
    return std::string(strip(unified));
}

std::vector<std::string> splitParagraphs(std::string_view text) {
    std::vector<std::string> out;
    auto emit = [&](std::string_view piece) {
        const std::string_view p = strip(piece);
        if (!p.empty()) out.emplace_back(p);
    };

    // A separator is "\n", any whitespace run, then the last "\n" of that run.
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\n') {
            ++i;
            continue;
        }
        size_t j = i + 1;
        size_t lastBreak = std::string_view::npos;
        while (j < text.size() && isSpace(text[j])) {
            if (text[j] == '\n') lastBreak = j;
            ++j;
        }
        if (lastBreak == std::string_view::npos) {
            ++i;
            continue;
        }
        emit(text.substr(start, i - start));
        start = lastBreak + 1;
        i = start;
    }
    emit(text.substr(start));
    return out;
}

Fingerprinter::Fingerprinter(
    HashingScheme scheme,
    const KeyProvider& keys,
    const std::string& default_key_name
) : scheme_(std::move(scheme)) {
    if (!scheme_.usesHmac()) return;

    const std::string name = scheme_.keyLookupName(default_key_name);
    key_ = keys.lookup(name);
    if (!key_) {
        throw FingerprintError("HMAC key missing for secrecy fingerprinting (lookup name '" +
                               name + "')");
    }
}

std::string Fingerprinter::digest(std::string_view payload) const {
    if (scheme_.usesHmac()) {
        if (!key_) {
            throw FingerprintError("HMAC key missing for secrecy fingerprinting");
        }
        return scheme_.digest_prefix + hmacSha256Hex(*key_, payload);
    }
    return scheme_.digest_prefix + sha256Hex(payload);
}

std::string Fingerprinter::fingerprintItem(const json::value& item) const {
    std::string payload;
    try {
        payload = canonicalBytes(item, CanonicalPolicy::UNICODE_PRESERVING);
    } catch (const NotSerializable& e) {
        throw FingerprintError(std::string("Item is not JSON-serializable: ") + e.what());
    }
    return digest(payload);
}

std::optional<std::string> Fingerprinter::fingerprintTextBlock(std::string_view text) const {
    const std::string normalized = normalizeText(text);
    if (normalized.empty()) return std::nullopt;
    return digest(normalized);
}

std::vector<std::string> Fingerprinter::fingerprintValue(const json::value& value) const {
    if (value.is_string()) {
        const json::string& s = value.get_string();
        auto fp = fingerprintTextBlock(std::string_view(s.data(), s.size()));
        if (!fp) return {};
        return {*fp};
    }
    return {fingerprintItem(value)};
}

std::vector<std::string> Fingerprinter::fingerprintStructured(const json::value& doc) const {
    std::vector<std::string> out;
    auto addAll = [&](const json::array& items) {
        for (const auto& item : items) {
            for (auto& fp : fingerprintValue(item)) out.push_back(std::move(fp));
        }
    };

    if (doc.is_null()) return out;
    if (doc.is_array()) {
        addAll(doc.get_array());
        return out;
    }
    if (doc.is_object()) {
        for (const char* key : kItemListKeys) {
            const json::value* v = doc.get_object().if_contains(key);
            if (v != nullptr && v->is_array()) {
                addAll(v->get_array());
                return out;
            }
        }
    }
    return fingerprintValue(doc);
}

std::vector<std::string> Fingerprinter::fingerprintJsonLines(std::string_view text) const {
    std::vector<std::string> out;
    const std::string unified = unifyNewlines(text);
    std::string_view rest(unified);

    while (!rest.empty()) {
        size_t n = 0;
        size_t brk = 0;
        while (n < rest.size() && (brk = lineBreakAt(rest, n)) == 0) ++n;
        const std::string_view line = rest.substr(0, n);
        rest.remove_prefix(n + brk);

        if (strip(line).empty()) continue;

        json::value v;
        try {
            v = parseJsonText(line);
        } catch (const DataFileError&) {
            // Unparsable lines still count as content.
            v = json::value(json::string(line));
        }
        for (auto& fp : fingerprintValue(v)) out.push_back(std::move(fp));
    }
    return out;
}

std::vector<std::string> Fingerprinter::fingerprintTextDocument(std::string_view text) const {
    const std::string unified = unifyNewlines(text);
    std::vector<std::string> out;
    for (const auto& paragraph : splitParagraphs(unified)) {
        if (auto fp = fingerprintTextBlock(paragraph)) out.push_back(std::move(*fp));
    }
    if (auto whole = fingerprintTextBlock(unified)) out.push_back(std::move(*whole));
    return out;
}

std::vector<std::string> Fingerprinter::fingerprintFile(const fs::path& path) const {
    const std::string ext = path.extension().string();
    if (ext == ".jsonl") {
        return fingerprintJsonLines(readCorpusText(path));
    }
    if (ext == ".json" || ext == ".yaml" || ext == ".yml") {
        return fingerprintStructured(loadDataFile(path));
    }
    if (ext == ".txt" || ext == ".md") {
        return fingerprintTextDocument(readCorpusText(path));
    }
    return {};
}

bool Fingerprinter::supportsFile(const fs::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".json" || ext == ".yaml" || ext == ".yml" ||
           ext == ".jsonl" || ext == ".txt" || ext == ".md";
}

}
