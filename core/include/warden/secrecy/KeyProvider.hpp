#pragma once

#include <map>
#include <optional>
#include <string>

namespace warden {

// Lookup name used when an HMAC scheme declares no key_id.
constexpr const char* kDefaultHmacKeyName = "WARDEN_SECRECY_HMAC_KEY";

// Source of HMAC keys. An empty value counts as missing.
class KeyProvider {
public:
    virtual ~KeyProvider() = default;
    virtual std::optional<std::string> lookup(const std::string& name) const = 0;
};

// Reads keys from the process environment.
class EnvironmentKeyProvider : public KeyProvider {
public:
    std::optional<std::string> lookup(const std::string& name) const override;
};

class StaticKeyProvider : public KeyProvider {
public:
    StaticKeyProvider() = default;
    explicit StaticKeyProvider(std::map<std::string, std::string> keys)
        : keys_(std::move(keys)) {}

    void set(
        const std::string& name,
        const std::string& value
    ) { keys_[name] = value; }

    std::optional<std::string> lookup(const std::string& name) const override;

private:
    std::map<std::string, std::string> keys_;
};

}
