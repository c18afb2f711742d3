#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "warden/secrecy/Fingerprinter.hpp"

namespace warden {

struct ScanResult {
    std::set<std::string> fingerprints;
    std::map<std::string, std::set<std::string>> fingerprint_sources;
    std::vector<std::string> scanned_files;
    std::vector<std::string> errors;

    // Appends other after this; scanned_files and errors keep their order.
    void merge(ScanResult&& other);

    // A non-empty error list means the corpus cannot be certified clean.
    bool hasErrors() const { return !errors.empty(); }
};

// ---------------------------------------------------------------------------
// CorpusScanner
//
// Walks protected directories and fingerprints every supported file.
// Per-file failures are recorded as "<rel-path>: <reason>" and scanning
// continues. With workers > 1 the sorted file list is cut into contiguous
// chunks, each scanned on its own thread into a private ScanResult, and
// the chunks are merged in order, so the result equals a sequential scan.
// ---------------------------------------------------------------------------
class CorpusScanner {
public:
    explicit CorpusScanner(
        const Fingerprinter& fingerprinter,
        size_t workers = 1
    );

    ScanResult scan(
        const std::filesystem::path& root,
        const std::vector<std::string>& protected_paths
    ) const;

    // Supported files under each protected path, relative to root.
    // Missing paths are skipped.
    static std::vector<std::string> collectFiles(
        const std::filesystem::path& root,
        const std::vector<std::string>& protected_paths
    );

    size_t workers() const { return workers_; }

private:
    ScanResult scanRange(
        const std::filesystem::path& root,
        const std::vector<std::string>& files,
        size_t begin,
        size_t end
    ) const;

    const Fingerprinter& fingerprinter_;
    size_t workers_;
};

}
