#pragma once
#include <cstddef>
#include <vector>
#include "canopy/core/hash.hpp"
#include "canopy/core/proof.hpp"

namespace canopy::core {

  // levels[0] holds the leaves, levels.back() holds only the root.
  using Levels = std::vector<std::vector<Hash>>;

  struct ProofOptions {
    size_t capacity = Proof::UNBOUNDED;
  };

  // Pairs are combined left to right; an unpaired last element is carried up
  // unchanged. Both throw EmptyInputError on an empty leaf set.
  Levels build_levels(const std::vector<Hash>& leaves, const HashFn& hash_fn);
  Hash merkle_root(const std::vector<Hash>& leaves, const HashFn& hash_fn);

  Proof proof_from_levels(const Levels& levels, size_t index, ProofOptions options = {});

  Proof merkle_proof_at(const std::vector<Hash>& leaves, size_t index, const HashFn& hash_fn, ProofOptions options = {});

  // Proves the first leaf equal to `leaf`; throws LeafNotFoundError if none is.
  Proof merkle_proof(const std::vector<Hash>& leaves, const Hash& leaf, const HashFn& hash_fn, ProofOptions options = {});

  // Replays the path and returns the candidate root.
  Hash merkle_proof_check(const Proof& proof, const Hash& leaf, const HashFn& hash_fn);

  inline bool verify_proof(const Hash& leaf, const Proof& proof, const Hash& root, const HashFn& hash_fn) {
    return merkle_proof_check(proof, leaf, hash_fn) == root;
  }

  // Side sequence of the path for `index` in a tree of `leaf_count` leaves.
  std::vector<Side> path_sides(size_t index, size_t leaf_count);

  bool path_matches_index(const Proof& proof, size_t index, size_t leaf_count);

  // ceil(log2(leaf_count)); the length of the longest proof in such a tree.
  size_t tree_height(size_t leaf_count);
}
