#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace warden {

struct LatticeIndexEntry {
    std::filesystem::path path;
    std::string hash;   // bare hex, no "sha256:" prefix
};

// Every lattice version in a directory, keyed by version string.
class LatticeIndex {
public:
    // Missing directory yields an empty index. A file without a version,
    // or two files declaring the same version, is a LatticeError.
    static LatticeIndex build(const std::filesystem::path& dir);

    const LatticeIndexEntry* find(const std::string& version) const;
    bool contains(const std::string& version) const { return find(version) != nullptr; }
    size_t size() const { return entries_.size(); }
    const std::map<std::string, LatticeIndexEntry>& entries() const { return entries_; }

private:
    std::map<std::string, LatticeIndexEntry> entries_;
};

// First *.yaml, then *.yml, then *.json in sorted order.
std::filesystem::path selectLatticeFile(const std::filesystem::path& dir);

}
