#include "warden/merkle/MerkleTree.hpp"
#include "warden/canon/ContentHash.hpp"
#include "warden/canon/DataFile.hpp"
#include "warden/canon/Digest.hpp"

#include <algorithm>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

std::string hashPair(
    const std::string& left,
    const std::string& right
) {
    return sha256Hex(left + right);
}

std::vector<std::string> nextLevel(const std::vector<std::string>& level) {
    std::vector<std::string> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
        const std::string& left = level[i];
        const std::string& right = i + 1 < level.size() ? level[i + 1] : left;
        next.push_back(hashPair(left, right));
    }
    return next;
}

} // namespace

std::string merkleRoot(const std::vector<std::string>& leaves) {
    if (leaves.empty()) return "";

    std::vector<std::string> level;
    level.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        level.push_back(normalizeHash(leaf));
    }

    while (level.size() > 1) {
        level = nextLevel(level);
    }
    return std::string(kSha256Prefix) + level.front();
}

bool verifyMerkleInclusion(
    const std::string& leaf,
    const MerkleProof& proof,
    const std::string& root
) noexcept {
    if (leaf.empty() || root.empty()) return false;

    try {
        std::string current = normalizeHash(leaf);
        for (const auto& step : proof) {
            const std::string sibling = normalizeHash(step.hash);
            switch (step.position) {
                case ProofPosition::LEFT:
                    current = hashPair(sibling, current);
                    break;
                case ProofPosition::RIGHT:
                    current = hashPair(current, sibling);
                    break;
                default:
                    return false;
            }
        }
        return verifyHash(root, current);
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<MerkleProof> buildInclusionProof(
    const std::vector<std::string>& leaves,
    size_t index
) {
    if (index >= leaves.size()) return std::nullopt;

    std::vector<std::string> level;
    level.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        level.push_back(normalizeHash(leaf));
    }

    MerkleProof proof;
    size_t idx = index;
    while (level.size() > 1) {
        const bool isLeftChild = idx % 2 == 0;
        const size_t sibling = isLeftChild
            ? std::min(idx + 1, level.size() - 1)
            : idx - 1;

        MerkleProofStep step;
        step.hash = std::string(kSha256Prefix) + level[sibling];
        step.position = isLeftChild ? ProofPosition::RIGHT : ProofPosition::LEFT;
        proof.push_back(std::move(step));

        level = nextLevel(level);
        idx /= 2;
    }
    return proof;
}

MerkleProof parseProof(const json::value& raw) {
    MerkleProof proof;
    if (!raw.is_array()) return proof;

    for (const auto& item : raw.get_array()) {
        MerkleProofStep step;
        if (const json::value* h = findMember(item, "hash"); h && h->is_string()) {
            step.hash = std::string(h->get_string());
        }
        const std::string position = stringMember(item, "position");
        if (position == "left") {
            step.position = ProofPosition::LEFT;
        } else if (position == "right") {
            step.position = ProofPosition::RIGHT;
        }
        proof.push_back(std::move(step));
    }
    return proof;
}

json::array proofToJson(const MerkleProof& proof) {
    json::array out;
    for (const auto& step : proof) {
        json::object o;
        o["hash"] = step.hash;
        o["position"] = proofPositionToString(step.position);
        out.push_back(std::move(o));
    }
    return out;
}

std::string artifactMerkleRoot(
    const json::array& artifacts,
    const std::string& hash_field
) {
    std::vector<std::string> hashes;
    for (const auto& artifact : artifacts) {
        const std::string h = stringMember(artifact, hash_field);
        if (!h.empty()) hashes.push_back(h);
    }
    if (hashes.empty()) return "";

    std::sort(hashes.begin(), hashes.end());
    return merkleRoot(hashes);
}

std::string ledgerRoot(const std::vector<json::value>& entries) {
    std::vector<std::string> hashes;
    for (const auto& entry : entries) {
        if (entry.is_object()) {
            hashes.push_back(contentHash(entry));
        }
    }
    std::sort(hashes.begin(), hashes.end());
    return merkleRoot(hashes);
}

std::string ledgerRootForDirectory(const fs::path& dir) {
    std::vector<json::value> entries;
    for (const auto& file : iterDataFiles(dir)) {
        entries.push_back(loadDataFile(file));
    }
    return ledgerRoot(entries);
}

}
