#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <boost/json.hpp>

namespace warden {

enum class ProofPosition : uint8_t {
    LEFT = 0,
    RIGHT = 1,
    INVALID = 2
};

inline const char* proofPositionToString(ProofPosition p) {
    switch (p) {
        case ProofPosition::LEFT:  return "left";
        case ProofPosition::RIGHT: return "right";
        default:                   return "invalid";
    }
}

// Position is where the sibling sits relative to the running hash.
struct MerkleProofStep {
    std::string hash;
    ProofPosition position = ProofPosition::INVALID;
};

using MerkleProof = std::vector<MerkleProofStep>;

// Order-sensitive. Parents hash the concatenated hex text of both
// children; an odd level duplicates its last node. Empty input gives "".
std::string merkleRoot(const std::vector<std::string>& leaves);

// Never throws. Empty leaf/root or an INVALID step is simply false.
bool verifyMerkleInclusion(
    const std::string& leaf,
    const MerkleProof& proof,
    const std::string& root
) noexcept;

// Sibling path for leaves[index] under merkleRoot's construction.
std::optional<MerkleProof> buildInclusionProof(
    const std::vector<std::string>& leaves,
    size_t index
);

// [{hash, position}] -> steps. Anything malformed becomes INVALID.
MerkleProof parseProof(const boost::json::value& raw);

boost::json::array proofToJson(const MerkleProof& proof);

// Order-independent: collects non-empty hash_field strings, sorts, roots.
std::string artifactMerkleRoot(
    const boost::json::array& artifacts,
    const std::string& hash_field = "hash"
);

// merkleRoot over the sorted content hashes of the object entries.
std::string ledgerRoot(const std::vector<boost::json::value>& entries);

// ledgerRoot over every structured data file under dir.
std::string ledgerRootForDirectory(const std::filesystem::path& dir);

}
