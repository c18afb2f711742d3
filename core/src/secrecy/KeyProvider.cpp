#include "warden/secrecy/KeyProvider.hpp"

#include <cstdlib>

namespace warden {

std::optional<std::string> EnvironmentKeyProvider::lookup(const std::string& name) const {
    const char* val = std::getenv(name.c_str());
    if (val == nullptr || *val == '\0') return std::nullopt;
    return std::string(val);
}

std::optional<std::string> StaticKeyProvider::lookup(const std::string& name) const {
    auto it = keys_.find(name);
    if (it == keys_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

}
