#include <gtest/gtest.h>

#include "warden/merkle/MerkleTree.hpp"
#include "warden/canon/ContentHash.hpp"
#include "warden/canon/Digest.hpp"
#include "unit/TestSupport.hpp"

#include <algorithm>

using namespace warden;
namespace json = boost::json;

namespace {

std::vector<std::string> makeLeaves(size_t n) {
    std::vector<std::string> leaves;
    for (size_t i = 0; i < n; ++i) {
        leaves.push_back("sha256:" + sha256Hex("leaf-" + std::to_string(i)));
    }
    return leaves;
}

std::string flipLastHexChar(std::string h) {
    char& c = h.back();
    c = (c == '0') ? '1' : '0';
    return h;
}

}

// ============================================================================
// ROOT CONSTRUCTION
// ============================================================================
TEST(MerkleRootTest, Empty_IsEmptyString) {
    EXPECT_EQ(merkleRoot({}), "");
}

TEST(MerkleRootTest, SingleLeaf_IsItself) {
    const std::string leaf = sha256Hex("only");
    EXPECT_EQ(merkleRoot({leaf}), "sha256:" + leaf);
    EXPECT_EQ(merkleRoot({"sha256:" + leaf}), "sha256:" + leaf);
}

TEST(MerkleRootTest, TwoLeaves_HashOfConcatenatedHex) {
    const std::string a = sha256Hex("a");
    const std::string b = sha256Hex("b");
    EXPECT_EQ(merkleRoot({"sha256:" + a, b}), "sha256:" + sha256Hex(a + b));
}

TEST(MerkleRootTest, OddLevel_DuplicatesLastNode) {
    const std::string a = sha256Hex("a");
    const std::string b = sha256Hex("b");
    const std::string c = sha256Hex("c");
    const std::string expected = sha256Hex(sha256Hex(a + b) + sha256Hex(c + c));
    EXPECT_EQ(merkleRoot({a, b, c}), "sha256:" + expected);
}

TEST(MerkleRootTest, LeafOrder_ChangesRoot) {
    auto leaves = makeLeaves(4);
    const std::string root = merkleRoot(leaves);
    std::swap(leaves[0], leaves[3]);
    EXPECT_NE(merkleRoot(leaves), root);
}

// ============================================================================
// INCLUSION PROOFS
// ============================================================================
TEST(MerkleProofTest, EveryLeaf_VerifiesForManySizes) {
    for (size_t n = 1; n <= 9; ++n) {
        const auto leaves = makeLeaves(n);
        const std::string root = merkleRoot(leaves);
        for (size_t i = 0; i < n; ++i) {
            const auto proof = buildInclusionProof(leaves, i);
            ASSERT_TRUE(proof.has_value());
            EXPECT_TRUE(verifyMerkleInclusion(leaves[i], *proof, root))
                << "n=" << n << " i=" << i;
        }
    }
}

TEST(MerkleProofTest, OutOfRangeIndex_NoProof) {
    EXPECT_FALSE(buildInclusionProof(makeLeaves(3), 3).has_value());
    EXPECT_FALSE(buildInclusionProof({}, 0).has_value());
}

TEST(MerkleProofTest, TamperedLeafOrRoot_Fails) {
    const auto leaves = makeLeaves(5);
    const std::string root = merkleRoot(leaves);
    const auto proof = *buildInclusionProof(leaves, 2);

    EXPECT_FALSE(verifyMerkleInclusion(flipLastHexChar(leaves[2]), proof, root));
    EXPECT_FALSE(verifyMerkleInclusion(leaves[2], proof, flipLastHexChar(root)));
    EXPECT_FALSE(verifyMerkleInclusion(leaves[1], proof, root));
}

TEST(MerkleProofTest, TamperedSibling_Fails) {
    const auto leaves = makeLeaves(4);
    const std::string root = merkleRoot(leaves);
    auto proof = *buildInclusionProof(leaves, 1);
    proof[0].hash = flipLastHexChar(proof[0].hash);
    EXPECT_FALSE(verifyMerkleInclusion(leaves[1], proof, root));
}

TEST(MerkleProofTest, SwappedPosition_Fails) {
    const auto leaves = makeLeaves(4);
    const std::string root = merkleRoot(leaves);
    auto proof = *buildInclusionProof(leaves, 0);
    proof[0].position = ProofPosition::LEFT;
    EXPECT_FALSE(verifyMerkleInclusion(leaves[0], proof, root));
}

TEST(MerkleProofTest, EmptyInputs_Fail) {
    const auto leaves = makeLeaves(2);
    const std::string root = merkleRoot(leaves);
    const auto proof = *buildInclusionProof(leaves, 0);
    EXPECT_FALSE(verifyMerkleInclusion("", proof, root));
    EXPECT_FALSE(verifyMerkleInclusion(leaves[0], proof, ""));
}

TEST(MerkleProofTest, SingleLeaf_EmptyProofVerifies) {
    const auto leaves = makeLeaves(1);
    const auto proof = *buildInclusionProof(leaves, 0);
    EXPECT_TRUE(proof.empty());
    EXPECT_TRUE(verifyMerkleInclusion(leaves[0], proof, merkleRoot(leaves)));
}

// ============================================================================
// PROOF DOCUMENTS
// ============================================================================
TEST(MerkleProofJsonTest, RoundTripThroughDocument) {
    const auto leaves = makeLeaves(6);
    const std::string root = merkleRoot(leaves);
    const auto proof = *buildInclusionProof(leaves, 4);

    const json::value doc = json::parse(json::serialize(proofToJson(proof)));
    EXPECT_TRUE(verifyMerkleInclusion(leaves[4], parseProof(doc), root));
}

TEST(MerkleProofJsonTest, UnknownPosition_IsInvalid) {
    const auto leaves = makeLeaves(2);
    const std::string root = merkleRoot(leaves);
    const json::value doc = json::parse(
        "[{\"hash\":\"" + leaves[1] + "\",\"position\":\"up\"}]");

    const MerkleProof proof = parseProof(doc);
    ASSERT_EQ(proof.size(), 1u);
    EXPECT_EQ(proof[0].position, ProofPosition::INVALID);
    EXPECT_FALSE(verifyMerkleInclusion(leaves[0], proof, root));
}

TEST(MerkleProofJsonTest, MalformedSteps_ParseAsInvalid) {
    const MerkleProof proof = parseProof(json::parse(R"([5, {"position":"left"}])"));
    ASSERT_EQ(proof.size(), 2u);
    EXPECT_EQ(proof[0].position, ProofPosition::INVALID);
    EXPECT_EQ(proof[1].position, ProofPosition::LEFT);
    EXPECT_TRUE(proof[1].hash.empty());
    EXPECT_TRUE(parseProof(json::parse("{}")).empty());
}

// ============================================================================
// ARTIFACT AND LEDGER ROOTS
// ============================================================================
TEST(ArtifactRootTest, OrderIndependent) {
    const auto leaves = makeLeaves(3);
    json::array forward;
    json::array reverse;
    for (size_t i = 0; i < leaves.size(); ++i) {
        forward.push_back(json::object{{"hash", leaves[i]}});
        reverse.push_back(json::object{{"hash", leaves[leaves.size() - 1 - i]}});
    }
    EXPECT_EQ(artifactMerkleRoot(forward), artifactMerkleRoot(reverse));
}

TEST(ArtifactRootTest, SkipsEntriesWithoutHash) {
    const auto leaves = makeLeaves(2);
    json::array artifacts;
    artifacts.push_back(json::object{{"hash", leaves[0]}});
    artifacts.push_back(json::object{{"hash", ""}});
    artifacts.push_back(json::object{{"name", "x"}});
    artifacts.push_back(json::object{{"hash", 7}});
    EXPECT_EQ(artifactMerkleRoot(artifacts), merkleRoot({leaves[0]}));
    EXPECT_EQ(artifactMerkleRoot(json::array{}), "");
}

TEST(ArtifactRootTest, CustomField) {
    const auto leaves = makeLeaves(1);
    json::array artifacts;
    artifacts.push_back(json::object{{"digest", leaves[0]}});
    EXPECT_EQ(artifactMerkleRoot(artifacts, "digest"), merkleRoot(leaves));
    EXPECT_EQ(artifactMerkleRoot(artifacts), "");
}

TEST(LedgerRootTest, SortedContentHashesOfObjects) {
    const json::value a = json::parse(R"({"event":"a"})");
    const json::value b = json::parse(R"({"event":"b"})");
    std::vector<std::string> hashes{contentHash(a), contentHash(b)};
    std::sort(hashes.begin(), hashes.end());

    EXPECT_EQ(ledgerRoot({b, a, json::value(3)}), merkleRoot(hashes));
    EXPECT_EQ(ledgerRoot({a, b}), ledgerRoot({b, a}));
    EXPECT_EQ(ledgerRoot({}), "");
}

TEST(LedgerRootTest, Directory_MatchesInMemory) {
    warden::testing::TempDir dir;
    dir.write("2024/a.json", R"({"event":"a"})");
    dir.write("2024/b.yaml", "event: b\n");
    dir.write("2024/notes.md", "ignored");

    const json::value a = json::parse(R"({"event":"a"})");
    const json::value b = json::parse(R"({"event":"b"})");
    EXPECT_EQ(ledgerRootForDirectory(dir.path()), ledgerRoot({a, b}));
    EXPECT_EQ(ledgerRootForDirectory(dir.path() / "none"), "");
}
