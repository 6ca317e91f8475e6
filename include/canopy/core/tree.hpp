#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "canopy/core/hash.hpp"
#include "canopy/core/merkle.hpp"
#include "canopy/core/proof.hpp"

namespace canopy::core {

  // Build-once tree over caller-supplied leaf hashes. Immutable after
  // construction; proofs copy their siblings out and do not refer back to it.
  class MerkleTree {
    public:
      // Throws EmptyInputError if `leaves` is empty.
      MerkleTree(std::vector<Hash> leaves, HashFn hash_fn);

      const Hash& root() const { return levels_.back().front(); }
      const std::vector<Hash>& leaves() const { return levels_.front(); }
      const Levels& levels() const { return levels_; }
      const HashFn& hash_fn() const { return hash_fn_; }

      size_t leaf_count() const { return levels_.front().size(); }
      size_t height() const { return levels_.size() - 1; }

      std::optional<size_t> index_of(const Hash& leaf) const;

      Proof make_proof(const Hash& leaf, ProofOptions options = {}) const;
      Proof make_proof_at(size_t index, ProofOptions options = {}) const;

      // Replays `proof` from `leaf` and compares with this tree's root.
      bool verify_merkle_proof(const Hash& leaf, const Proof& proof) const;

      // Needs no tree instance, only the path, the expected root and the combiner.
      static bool verify(const Hash& leaf, const Proof& proof, const Hash& root, const HashFn& hash_fn);

    private:
      HashFn hash_fn_;
      Levels levels_;
  };
}
