#include "warden/lattice/LatticeIndex.hpp"
#include "warden/lattice/LatticeError.hpp"
#include "warden/canon/ContentHash.hpp"
#include "warden/canon/DataFile.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

LatticeIndex LatticeIndex::build(const fs::path& dir) {
    LatticeIndex index;
    for (const auto& file : iterDataFiles(dir)) {
        const json::value doc = loadDataFile(file);
        if (!doc.is_object()) continue;

        const json::value* v = findMember(doc, "version");
        const std::string version = v ? scalarText(*v) : std::string();
        if (version.empty()) {
            throw LatticeError("Lattice file missing version: " + file.string());
        }
        if (index.entries_.count(version)) {
            std::cerr << "[LatticeIndex] Duplicate version " << version
                      << " in " << file.string() << "\n";
            throw LatticeError("Duplicate lattice version '" + version + "' in " + file.string());
        }

        index.entries_.emplace(version, LatticeIndexEntry{
            file,
            normalizeHash(contentHash(doc))
        });
    }
    return index;
}

const LatticeIndexEntry* LatticeIndex::find(const std::string& version) const {
    auto it = entries_.find(version);
    return it == entries_.end() ? nullptr : &it->second;
}

fs::path selectLatticeFile(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw LatticeError("Context lattice directory not found: " + dir.string());
    }

    for (const char* ext : {".yaml", ".yml", ".json"}) {
        std::vector<fs::path> matches;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext) {
                matches.push_back(entry.path());
            }
        }
        if (!matches.empty()) {
            return *std::min_element(matches.begin(), matches.end());
        }
    }
    throw LatticeError("No context lattice files found in " + dir.string());
}

}
