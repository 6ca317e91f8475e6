#pragma once
#include <cstddef>
#include <optional>
#include "canopy/core/hash.hpp"
#include "canopy/core/merkle.hpp"
#include "canopy/core/proof.hpp"
#include "canopy/core/tree.hpp"

namespace canopy::core {

  struct Neighbor {
    Hash leaf{};
    size_t index = 0;
    Proof proof;
  };

  // Non-membership of a target in a tree whose leaves were sorted strictly
  // ascending when it was built. `left` is the greatest leaf below the target,
  // `right` the smallest leaf above it; one of them is absent when the target
  // lies outside the leaf range.
  struct ExclusionProof {
    std::optional<Neighbor> left;
    std::optional<Neighbor> right;
  };

  // Throws UnsortedInputError if the tree's leaves are not strictly ascending
  // and LeafPresentError if the target is a leaf.
  ExclusionProof make_exclusion_proof(const MerkleTree& tree, const Hash& target, ProofOptions options = {});

  // Checks both inclusion proofs against `root` and left < target < right.
  // Adjacency of the two neighbors is NOT established by this overload; the
  // caller must guarantee it, and one-sided proofs are always rejected.
  bool verify_exclusion_proof(const Hash& target, const ExclusionProof& proof, const Hash& root, const HashFn& hash_fn);

  // As above, and additionally binds each proof to its claimed index in a tree
  // of `leaf_count` leaves, requiring the indices to be consecutive (or the
  // single neighbor to be the first or last leaf).
  bool verify_exclusion_proof(const Hash& target, const ExclusionProof& proof, const Hash& root, const HashFn& hash_fn,
                              size_t leaf_count);
}
