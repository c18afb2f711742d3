#include "warden/secrecy/CorpusScanner.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <thread>

namespace fs = std::filesystem;

namespace warden {

void ScanResult::merge(ScanResult&& other) {
    fingerprints.insert(other.fingerprints.begin(), other.fingerprints.end());
    for (auto& kv : other.fingerprint_sources) {
        fingerprint_sources[kv.first].insert(kv.second.begin(), kv.second.end());
    }
    scanned_files.insert(scanned_files.end(),
                         std::make_move_iterator(other.scanned_files.begin()),
                         std::make_move_iterator(other.scanned_files.end()));
    errors.insert(errors.end(),
                  std::make_move_iterator(other.errors.begin()),
                  std::make_move_iterator(other.errors.end()));
}

CorpusScanner::CorpusScanner(
    const Fingerprinter& fingerprinter,
    size_t workers
) : fingerprinter_(fingerprinter),
    workers_(std::max<size_t>(1, workers)) {}

std::vector<std::string> CorpusScanner::collectFiles(
    const fs::path& root,
    const std::vector<std::string>& protected_paths
) {
    std::vector<std::string> files;
    for (const auto& rel : protected_paths) {
        const fs::path base = root / rel;
        if (!fs::exists(base)) continue;

        std::vector<std::string> found;
        if (fs::is_regular_file(base)) {
            if (Fingerprinter::supportsFile(base)) {
                found.push_back(fs::relative(base, root).generic_string());
            }
        } else {
            for (const auto& entry : fs::recursive_directory_iterator(base)) {
                if (!entry.is_regular_file()) continue;
                if (!Fingerprinter::supportsFile(entry.path())) continue;
                found.push_back(fs::relative(entry.path(), root).generic_string());
            }
        }
        std::sort(found.begin(), found.end());
        files.insert(files.end(), found.begin(), found.end());
    }
    return files;
}

ScanResult CorpusScanner::scanRange(
    const fs::path& root,
    const std::vector<std::string>& files,
    size_t begin,
    size_t end
) const {
    ScanResult result;
    for (size_t i = begin; i < end; ++i) {
        const std::string& rel = files[i];
        result.scanned_files.push_back(rel);
        try {
            for (auto& fp : fingerprinter_.fingerprintFile(root / rel)) {
                result.fingerprint_sources[fp].insert(rel);
                result.fingerprints.insert(std::move(fp));
            }
        } catch (const std::exception& e) {
            result.errors.push_back(rel + ": " + e.what());
        }
    }
    return result;
}

ScanResult CorpusScanner::scan(
    const fs::path& root,
    const std::vector<std::string>& protected_paths
) const {
    const std::vector<std::string> files = collectFiles(root, protected_paths);
    const size_t n = std::min(workers_, std::max<size_t>(1, files.size()));

    ScanResult result;
    if (n <= 1) {
        result = scanRange(root, files, 0, files.size());
    } else {
        std::vector<ScanResult> partial(n);
        std::vector<std::thread> threads;
        threads.reserve(n);

        const size_t chunk = (files.size() + n - 1) / n;
        for (size_t w = 0; w < n; ++w) {
            const size_t begin = std::min(files.size(), w * chunk);
            const size_t end = std::min(files.size(), begin + chunk);
            threads.emplace_back([this, &root, &files, &partial, w, begin, end]() {
                partial[w] = scanRange(root, files, begin, end);
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        for (auto& p : partial) {
            result.merge(std::move(p));
        }
    }

    for (const auto& err : result.errors) {
        std::cerr << "[CorpusScanner] " << err << "\n";
    }
    std::cout << "[CorpusScanner] Scanned " << result.scanned_files.size()
              << " file(s), " << result.fingerprints.size() << " fingerprint(s), "
              << result.errors.size() << " error(s) using " << n << " worker(s)\n";
    return result;
}

}
