#include <gtest/gtest.h>
#include <algorithm>
#include "canopy/core/errors.hpp"
#include "canopy/core/hash.hpp"
#include "canopy/core/merkle.hpp"

using namespace canopy::core;

static Hash hash_of(const std::string& s) {
  return sha256(s);
}

static std::vector<Hash> make_leaves(size_t n) {
  std::vector<Hash> leaves;
  leaves.reserve(n);
  for (size_t i = 0; i < n; ++i) leaves.push_back(hash_of("leaf-" + std::to_string(i)));
  return leaves;
}

TEST(Merkle, EmptyInputRejected) {
  std::vector<Hash> leaves;
  EXPECT_THROW(merkle_root(leaves, sha256_pair), EmptyInputError);
  EXPECT_THROW(build_levels(leaves, sha256_pair), EmptyInputError);
  EXPECT_THROW(merkle_proof_at(leaves, 0, sha256_pair), EmptyInputError);
  EXPECT_THROW(merkle_proof(leaves, hash_of("a"), sha256_pair), EmptyInputError);
}

TEST(Merkle, SingleLeafIsRoot) {
  std::vector<Hash> leaves{ hash_of("a") };
  EXPECT_EQ(merkle_root(leaves, sha256_pair), leaves[0]);
  auto proof = merkle_proof_at(leaves, 0, sha256_pair);
  EXPECT_EQ(proof.len(), 0u);
  EXPECT_TRUE(verify_proof(leaves[0], proof, leaves[0], sha256_pair));
}

TEST(Merkle, OddLeafIsCarriedUpUnchanged) {
  auto a = hash_of("a"), b = hash_of("b"), c = hash_of("c");
  std::vector<Hash> leaves{ a, b, c };
  auto ab = sha256_pair(a, b);
  EXPECT_EQ(merkle_root(leaves, sha256_pair), sha256_pair(ab, c));

  auto proof = merkle_proof(leaves, c, sha256_pair);
  ASSERT_EQ(proof.len(), 1u);
  EXPECT_EQ(proof.at(0).data, ab);
  EXPECT_EQ(proof.at(0).side, Side::Left);
}

TEST(Merkle, FiveLeafShape) {
  auto leaves = make_leaves(5);
  auto l01 = sha256_pair(leaves[0], leaves[1]);
  auto l23 = sha256_pair(leaves[2], leaves[3]);
  auto expected = sha256_pair(sha256_pair(l01, l23), leaves[4]);
  EXPECT_EQ(merkle_root(leaves, sha256_pair), expected);

  auto levels = build_levels(leaves, sha256_pair);
  ASSERT_EQ(levels.size(), 4u);
  EXPECT_EQ(levels[1].size(), 3u);
  EXPECT_EQ(levels[1][2], leaves[4]);
  EXPECT_EQ(levels[2].size(), 2u);
  EXPECT_EQ(levels.back().size(), 1u);
  EXPECT_EQ(levels.back().front(), expected);

  auto proof = merkle_proof_at(leaves, 2, sha256_pair);
  ASSERT_EQ(proof.len(), 3u);
  EXPECT_EQ(proof.at(0).data, leaves[3]);
  EXPECT_EQ(proof.at(0).side, Side::Right);
  EXPECT_EQ(proof.at(1).data, l01);
  EXPECT_EQ(proof.at(1).side, Side::Left);
  EXPECT_EQ(proof.at(2).data, leaves[4]);
  EXPECT_EQ(proof.at(2).side, Side::Right);
}

TEST(Merkle, RootIsDeterministicAndOrderSensitive) {
  auto leaves = make_leaves(6);
  EXPECT_EQ(merkle_root(leaves, sha256_pair), merkle_root(leaves, sha256_pair));

  auto swapped = leaves;
  std::swap(swapped[0], swapped[1]);
  EXPECT_NE(merkle_root(leaves, sha256_pair), merkle_root(swapped, sha256_pair));

  auto changed = leaves;
  changed[5] = hash_of("x");
  EXPECT_NE(merkle_root(leaves, sha256_pair), merkle_root(changed, sha256_pair));
}

TEST(Merkle, EveryLeafRoundTrips) {
  for (size_t n = 1; n <= 33; ++n) {
    auto leaves = make_leaves(n);
    auto root = merkle_root(leaves, sha256_pair);
    for (size_t i = 0; i < n; ++i) {
      auto proof = merkle_proof_at(leaves, i, sha256_pair);
      EXPECT_EQ(merkle_proof_check(proof, leaves[i], sha256_pair), root) << "n=" << n << " i=" << i;
      EXPECT_TRUE(path_matches_index(proof, i, n));
    }
  }
}

TEST(Merkle, ProofSizesFollowCeilLog2) {
  struct Row { size_t leaves; size_t height; };
  const Row table[] = { {1, 0}, {2, 1}, {3, 2}, {4, 2}, {5, 3}, {8, 3}, {9, 4}, {16, 4}, {17, 5}, {100, 7}, {1024, 10} };
  for (const auto& row : table) {
    auto leaves = make_leaves(row.leaves);
    EXPECT_EQ(tree_height(row.leaves), row.height);
    auto levels = build_levels(leaves, sha256_pair);
    EXPECT_EQ(levels.size() - 1, row.height);
    size_t longest = 0;
    for (size_t i = 0; i < row.leaves; ++i) {
      auto proof = proof_from_levels(levels, i);
      EXPECT_LE(proof.len(), row.height);
      longest = std::max(longest, proof.len());
    }
    EXPECT_EQ(longest, row.height) << "leaves=" << row.leaves;
  }
}

TEST(Merkle, WrongLeafOrForeignProofFails) {
  auto leaves = make_leaves(5);
  auto root = merkle_root(leaves, sha256_pair);
  auto proof0 = merkle_proof_at(leaves, 0, sha256_pair);
  EXPECT_FALSE(verify_proof(hash_of("A"), proof0, root, sha256_pair));
  EXPECT_FALSE(verify_proof(leaves[1], proof0, root, sha256_pair));

  auto other_root = merkle_root(make_leaves(6), sha256_pair);
  EXPECT_FALSE(verify_proof(leaves[0], proof0, other_root, sha256_pair));
}

TEST(Merkle, ProofLookupErrors) {
  auto leaves = make_leaves(4);
  EXPECT_THROW(merkle_proof(leaves, hash_of("missing"), sha256_pair), LeafNotFoundError);
  EXPECT_THROW(merkle_proof_at(leaves, 4, sha256_pair), IndexOutOfRangeError);
  EXPECT_THROW(merkle_proof_at(leaves, 100, sha256_pair), IndexOutOfRangeError);
}

TEST(Merkle, ByValueProvesFirstOccurrence) {
  auto leaves = make_leaves(4);
  leaves[3] = leaves[1];
  auto proof = merkle_proof(leaves, leaves[1], sha256_pair);
  EXPECT_EQ(proof, merkle_proof_at(leaves, 1, sha256_pair));
}

TEST(Merkle, CapacityBoundary) {
  auto leaves = make_leaves(8);
  EXPECT_THROW(merkle_proof_at(leaves, 0, sha256_pair, ProofOptions{2}), ProofCapacityExceededError);
  auto exact = merkle_proof_at(leaves, 0, sha256_pair, ProofOptions{3});
  EXPECT_EQ(exact.len(), 3u);
  EXPECT_TRUE(exact.full());

  // Carried-up leaf of a 5-leaf tree needs only one node.
  auto five = make_leaves(5);
  auto short_path = merkle_proof_at(five, 4, sha256_pair, ProofOptions{1});
  EXPECT_EQ(short_path.len(), 1u);
  EXPECT_THROW(merkle_proof_at(five, 0, sha256_pair, ProofOptions{1}), ProofCapacityExceededError);
}

TEST(Merkle, CombinerCalledOncePerInternalNode) {
  for (size_t n = 1; n <= 20; ++n) {
    size_t calls = 0;
    HashFn counting = [&calls](const Hash& l, const Hash& r) {
      ++calls;
      return sha256_pair(l, r);
    };
    merkle_root(make_leaves(n), counting);
    EXPECT_EQ(calls, n - 1) << "n=" << n;
  }
}

TEST(Merkle, WorksWithAnyCombiner) {
  HashFn xor_add = [](const Hash& l, const Hash& r) {
    Hash out{};
    for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<uint8_t>((l[i] ^ r[(i + 1) % 32]) + 1);
    return out;
  };
  auto leaves = make_leaves(11);
  auto root = merkle_root(leaves, xor_add);
  for (size_t i = 0; i < leaves.size(); ++i) {
    EXPECT_TRUE(verify_proof(leaves[i], merkle_proof_at(leaves, i, xor_add), root, xor_add));
  }
  EXPECT_NE(root, merkle_root(leaves, sha256_pair));
}

TEST(Merkle, PathSidesEncodeIndex) {
  auto sides = path_sides(2, 3);
  ASSERT_EQ(sides.size(), 1u);
  EXPECT_EQ(sides[0], Side::Left);

  EXPECT_EQ(path_sides(0, 1).size(), 0u);
  EXPECT_THROW(path_sides(0, 0), EmptyInputError);
  EXPECT_THROW(path_sides(3, 3), IndexOutOfRangeError);

  auto leaves = make_leaves(6);
  auto proof = merkle_proof_at(leaves, 1, sha256_pair);
  EXPECT_TRUE(path_matches_index(proof, 1, 6));
  EXPECT_FALSE(path_matches_index(proof, 0, 6));
  EXPECT_FALSE(path_matches_index(proof, 2, 6));
  EXPECT_FALSE(path_matches_index(proof, 6, 6));
}
