#include "warden/canon/Canonical.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace json = boost::json;

namespace warden {

namespace {

bool decodeUtf8(
    std::string_view s,
    size_t i,
    uint32_t& cp,
    size_t& len
) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        len = 1;
        return true;
    }

    size_t n = 0;
    uint32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0) {
        n = 2;
        cp = b0 & 0x1F;
        min_cp = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        n = 3;
        cp = b0 & 0x0F;
        min_cp = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        n = 4;
        cp = b0 & 0x07;
        min_cp = 0x10000;
    } else {
        return false;
    }

    if (i + n > s.size()) return false;

    for (size_t k = 1; k < n; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range code points are invalid
    if (cp < min_cp || cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;

    len = n;
    return true;
}

void appendUnicodeEscape(
    uint32_t unit,
    std::string& out
) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(unit));
    out += buf;
}

void writeString(
    std::string_view s,
    CanonicalPolicy policy,
    std::string& out
) {
    out += '"';

    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                case '\b': out += "\\b";  break;
                case '\f': out += "\\f";  break;
                default:
                    if (c < 0x20 ||
                        (c == 0x7F && policy == CanonicalPolicy::ASCII_ESCAPED)) {
                        appendUnicodeEscape(c, out);
                    } else {
                        out += static_cast<char>(c);
                    }
            }
            ++i;
            continue;
        }

        uint32_t cp = 0;
        size_t len = 0;
        if (!decodeUtf8(s, i, cp, len)) {
            throw NotSerializable(
                "string contains invalid UTF-8 at byte " + std::to_string(i)
            );
        }

        if (policy == CanonicalPolicy::UNICODE_PRESERVING) {
            out.append(s.substr(i, len));
        } else if (cp > 0xFFFF) {
            const uint32_t v = cp - 0x10000;
            appendUnicodeEscape(0xD800 + (v >> 10), out);
            appendUnicodeEscape(0xDC00 + (v & 0x3FF), out);
        } else {
            appendUnicodeEscape(cp, out);
        }

        i += len;
    }

    out += '"';
}

void writeValue(
    const json::value& v,
    CanonicalPolicy policy,
    std::string& out
) {
    switch (v.kind()) {
        case json::kind::null:
            out += "null";
            break;

        case json::kind::bool_:
            out += v.get_bool() ? "true" : "false";
            break;

        case json::kind::int64:
            out += std::to_string(v.get_int64());
            break;

        case json::kind::uint64:
            out += std::to_string(v.get_uint64());
            break;

        case json::kind::double_:
            out += formatCanonicalDouble(v.get_double());
            break;

        case json::kind::string: {
            const json::string& s = v.get_string();
            writeString(std::string_view(s.data(), s.size()), policy, out);
            break;
        }

        case json::kind::array: {
            out += '[';
            bool first = true;
            for (const auto& item : v.get_array()) {
                if (!first) out += ',';
                first = false;
                writeValue(item, policy, out);
            }
            out += ']';
            break;
        }

        case json::kind::object: {
            const json::object& obj = v.get_object();

            std::vector<const json::key_value_pair*> members;
            members.reserve(obj.size());
            for (const auto& kv : obj) {
                members.push_back(&kv);
            }

            // Byte order of UTF-8 keys equals code point order
            std::sort(
                members.begin(),
                members.end(),
                [](const json::key_value_pair* a, const json::key_value_pair* b) {
                    return a->key() < b->key();
                }
            );

            out += '{';
            bool first = true;
            for (const auto* kv : members) {
                if (!first) out += ',';
                first = false;
                writeString(kv->key(), policy, out);
                out += ':';
                writeValue(kv->value(), policy, out);
            }
            out += '}';
            break;
        }
    }
}

} // namespace

std::string formatCanonicalDouble(double d) {
    if (!std::isfinite(d)) {
        throw NotSerializable("non-finite number has no canonical form");
    }

    char buf[64];
    auto res = std::to_chars(
        buf,
        buf + sizeof(buf),
        d,
        std::chars_format::scientific
    );
    const std::string sci(buf, res.ptr);

    const bool negative = !sci.empty() && sci[0] == '-';
    const size_t start = negative ? 1 : 0;
    const size_t epos = sci.find('e');

    std::string digits;
    for (size_t i = start; i < epos; ++i) {
        if (sci[i] != '.') digits += sci[i];
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    const int exponent = std::atoi(sci.c_str() + epos + 1);
    const int decpt = exponent + 1;
    const int ndigits = static_cast<int>(digits.size());

    std::string out = negative ? "-" : "";

    if (decpt <= -4 || decpt > 16) {
        out += digits[0];
        if (ndigits > 1) {
            out += '.';
            out += digits.substr(1);
        }
        const int e = decpt - 1;
        out += 'e';
        out += e < 0 ? '-' : '+';
        std::string es = std::to_string(std::abs(e));
        if (es.size() < 2) es = "0" + es;
        out += es;
    } else if (decpt <= 0) {
        out += "0.";
        out.append(static_cast<size_t>(-decpt), '0');
        out += digits;
    } else if (decpt >= ndigits) {
        out += digits;
        out.append(static_cast<size_t>(decpt - ndigits), '0');
        out += ".0";
    } else {
        out += digits.substr(0, static_cast<size_t>(decpt));
        out += '.';
        out += digits.substr(static_cast<size_t>(decpt));
    }

    return out;
}

std::string canonicalBytes(
    const json::value& value,
    CanonicalPolicy policy
) {
    std::string out;
    writeValue(value, policy, out);
    return out;
}

std::string sanitizeUtf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = 0;
        size_t len = 0;
        if (decodeUtf8(text, i, cp, len)) {
            out.append(text.substr(i, len));
            i += len;
        } else {
            ++i;
        }
    }
    return out;
}

bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = 0;
        size_t len = 0;
        if (!decodeUtf8(text, i, cp, len)) return false;
        i += len;
    }
    return true;
}

}
