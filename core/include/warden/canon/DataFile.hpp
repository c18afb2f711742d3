#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

namespace YAML {
class Node;
}

namespace warden {

class DataFileError : public std::runtime_error {
public:
    explicit DataFileError(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

// .json, .yaml, .yml
bool isStructuredDataFile(const std::filesystem::path& path);

std::string readFileBytes(const std::filesystem::path& path);

boost::json::value parseJsonText(std::string_view text);

// YAML 1.1 plain-scalar resolution, so a YAML file and its JSON
// rendering produce the same value.
boost::json::value parseYamlText(const std::string& text);

boost::json::value yamlToJson(const YAML::Node& node);

// Dispatches on suffix. Anything else is a DataFileError.
boost::json::value loadDataFile(const std::filesystem::path& path);

// Every structured data file below dir, recursively, sorted.
std::vector<std::filesystem::path> iterDataFiles(
    const std::filesystem::path& dir
);

// Small accessors shared by the document readers
const boost::json::value* findMember(
    const boost::json::value& doc,
    std::string_view key
);

std::string stringMember(
    const boost::json::value& doc,
    std::string_view key
);

// Strings as-is, other scalars as their JSON text
std::string scalarText(const boost::json::value& v);

}
