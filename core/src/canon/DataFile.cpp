#include "warden/canon/DataFile.hpp"
#include "warden/canon/Canonical.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <regex>
#include <set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

const char* const kTagStr   = "tag:yaml.org,2002:str";
const char* const kTagInt   = "tag:yaml.org,2002:int";
const char* const kTagFloat = "tag:yaml.org,2002:float";
const char* const kTagBool  = "tag:yaml.org,2002:bool";
const char* const kTagNull  = "tag:yaml.org,2002:null";
const char* const kTagSeq   = "tag:yaml.org,2002:seq";
const char* const kTagMap   = "tag:yaml.org,2002:map";
const char* const kTagSet   = "tag:yaml.org,2002:set";
const char* const kTagOmap  = "tag:yaml.org,2002:omap";
const char* const kTagPairs = "tag:yaml.org,2002:pairs";

bool isUntagged(const std::string& tag) {
    return tag.empty() || tag == "?" || tag == "!";
}

std::string stripUnderscores(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '_') out += c;
    }
    return out;
}

json::value parseYamlInt(const std::string& raw) {
    std::string s = stripUnderscores(raw);
    bool negative = false;
    size_t pos = 0;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = s[0] == '-';
        pos = 1;
    }

    int base = 10;
    if (s.compare(pos, 2, "0b") == 0) {
        base = 2;
        pos += 2;
    } else if (s.compare(pos, 2, "0x") == 0) {
        base = 16;
        pos += 2;
    } else if (s.size() - pos > 1 && s[pos] == '0') {
        base = 8;
        pos += 1;
    }

    unsigned long long magnitude = 0;
    const char* first = s.data() + pos;
    const char* last = s.data() + s.size();
    auto res = std::from_chars(first, last, magnitude, base);
    if (res.ec != std::errc() || res.ptr != last) {
        throw DataFileError("YAML integer out of range: " + raw);
    }

    constexpr auto kMaxSigned =
        static_cast<unsigned long long>(std::numeric_limits<int64_t>::max());

    if (negative) {
        if (magnitude > kMaxSigned + 1) {
            throw DataFileError("YAML integer out of range: " + raw);
        }
        if (magnitude == kMaxSigned + 1) {
            return json::value(std::numeric_limits<int64_t>::min());
        }
        return json::value(-static_cast<int64_t>(magnitude));
    }
    if (magnitude > kMaxSigned) {
        return json::value(static_cast<uint64_t>(magnitude));
    }
    return json::value(static_cast<int64_t>(magnitude));
}

json::value parseYamlFloat(const std::string& raw) {
    std::string s = stripUnderscores(raw);
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("nan") != std::string::npos) {
        return json::value(std::numeric_limits<double>::quiet_NaN());
    }
    if (lower.find("inf") != std::string::npos) {
        const double inf = std::numeric_limits<double>::infinity();
        return json::value(lower[0] == '-' ? -inf : inf);
    }

    char* end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') {
        throw DataFileError("invalid YAML float: " + raw);
    }
    return json::value(d);
}

json::value resolvePlainScalar(const std::string& s) {
    static const std::set<std::string> kNulls = {
        "", "~", "null", "Null", "NULL"
    };
    static const std::set<std::string> kTrue = {
        "yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"
    };
    static const std::set<std::string> kFalse = {
        "no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"
    };
    static const std::regex kIntPattern(
        R"(^[-+]?(0b[0-1_]+|0[0-7_]+|0|[1-9][0-9_]*|0x[0-9a-fA-F_]+)$)"
    );
    static const std::regex kFloatPattern(
        R"(^([-+]?[0-9][0-9_]*\.[0-9_]*([eE][-+][0-9]+)?|\.[0-9_]+([eE][-+][0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))$)"
    );

    if (kNulls.count(s)) return nullptr;
    if (kTrue.count(s)) return true;
    if (kFalse.count(s)) return false;
    if (std::regex_match(s, kIntPattern)) return parseYamlInt(s);
    if (std::regex_match(s, kFloatPattern)) return parseYamlFloat(s);
    return json::value(json::string(s));
}

json::value convertScalar(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    if (tag == "!" || tag == kTagStr) return json::value(json::string(text));
    if (tag.empty() || tag == "?") return resolvePlainScalar(text);
    if (tag == kTagInt) return parseYamlInt(text);
    if (tag == kTagFloat) return parseYamlFloat(text);
    if (tag == kTagNull) return nullptr;
    if (tag == kTagBool) {
        json::value v = resolvePlainScalar(text);
        if (!v.is_bool()) {
            throw DataFileError("invalid YAML boolean: " + text);
        }
        return v;
    }
    throw DataFileError("unsupported YAML tag '" + tag + "'");
}

void checkCollectionTag(
    const std::string& tag,
    const char* expected
) {
    if (isUntagged(tag) || tag == expected) return;
    if (tag == kTagSet || tag == kTagOmap || tag == kTagPairs) {
        throw NotSerializable("YAML collection '" + tag + "' has no canonical ordering");
    }
    throw DataFileError("unsupported YAML tag '" + tag + "'");
}

std::string convertKey(const YAML::Node& key) {
    switch (key.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return "null";
        case YAML::NodeType::Scalar: {
            json::value k = convertScalar(key);
            if (k.is_string()) {
                const json::string& s = k.get_string();
                return std::string(s.data(), s.size());
            }
            return canonicalBytes(k);
        }
        default:
            throw NotSerializable("YAML mapping key is not a scalar");
    }
}

} // namespace

bool isStructuredDataFile(const fs::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".json" || ext == ".yaml" || ext == ".yml";
}

std::string readFileBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw DataFileError("Cannot open file: " + path.string());
    }

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    if (in.bad()) {
        throw DataFileError("Failed reading file: " + path.string());
    }
    return data;
}

json::value parseJsonText(std::string_view text) {
    // Correctly rounded doubles, matching strtod on the YAML path.
    json::parse_options opt;
    opt.numbers = json::number_precision::precise;

    json::error_code ec;
    json::value v = json::parse(text, ec, json::storage_ptr(), opt);
    if (ec) {
        throw DataFileError("invalid JSON: " + ec.message());
    }
    return v;
}

json::value yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Scalar:
            return convertScalar(node);

        case YAML::NodeType::Sequence: {
            checkCollectionTag(node.Tag(), kTagSeq);
            json::array arr;
            for (const auto& child : node) {
                arr.push_back(yamlToJson(child));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            checkCollectionTag(node.Tag(), kTagMap);
            json::object obj;
            for (auto it = node.begin(); it != node.end(); ++it) {
                obj[convertKey(it->first)] = yamlToJson(it->second);
            }
            return obj;
        }
    }
    return nullptr;
}

json::value parseYamlText(const std::string& text) {
    try {
        return yamlToJson(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw DataFileError(std::string("invalid YAML: ") + e.what());
    }
}

json::value loadDataFile(const fs::path& path) {
    const std::string ext = path.extension().string();

    if (ext == ".json") {
        const std::string text = readFileBytes(path);
        try {
            return parseJsonText(text);
        } catch (const DataFileError& e) {
            throw DataFileError(path.string() + ": " + e.what());
        }
    }

    if (ext == ".yaml" || ext == ".yml") {
        const std::string text = readFileBytes(path);
        try {
            return parseYamlText(text);
        } catch (const DataFileError& e) {
            throw DataFileError(path.string() + ": " + e.what());
        }
    }

    throw DataFileError("Unsupported data file suffix: " + ext);
}

std::vector<fs::path> iterDataFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    if (!fs::exists(dir)) return files;

    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (!isStructuredDataFile(entry.path())) continue;
        files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end());
    return files;
}

const json::value* findMember(
    const json::value& doc,
    std::string_view key
) {
    if (!doc.is_object()) return nullptr;
    return doc.get_object().if_contains(key);
}

std::string stringMember(
    const json::value& doc,
    std::string_view key
) {
    const json::value* v = findMember(doc, key);
    if (v == nullptr || !v->is_string()) return "";
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

std::string scalarText(const json::value& v) {
    if (v.is_string()) {
        const json::string& s = v.get_string();
        return std::string(s.data(), s.size());
    }
    if (v.is_null()) return "";
    return json::serialize(v);
}

}
