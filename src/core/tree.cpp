#include "canopy/core/tree.hpp"
#include "canopy/core/errors.hpp"
#include <algorithm>

namespace canopy::core {

  MerkleTree::MerkleTree(std::vector<Hash> leaves, HashFn hash_fn) : hash_fn_(std::move(hash_fn)) {
    if (leaves.empty()) throw EmptyInputError();
    levels_ = build_levels(leaves, hash_fn_);
  }

  std::optional<size_t> MerkleTree::index_of(const Hash& leaf) const {
    const auto& leaf_hashes = leaves();
    auto it = std::find(leaf_hashes.begin(), leaf_hashes.end(), leaf);
    if (it == leaf_hashes.end()) return std::nullopt;
    return static_cast<size_t>(it - leaf_hashes.begin());
  }

  Proof MerkleTree::make_proof(const Hash& leaf, ProofOptions options) const {
    auto index = index_of(leaf);
    if (!index) throw LeafNotFoundError();
    return proof_from_levels(levels_, *index, options);
  }

  Proof MerkleTree::make_proof_at(size_t index, ProofOptions options) const {
    return proof_from_levels(levels_, index, options);
  }

  bool MerkleTree::verify_merkle_proof(const Hash& leaf, const Proof& proof) const {
    return verify(leaf, proof, root(), hash_fn_);
  }

  bool MerkleTree::verify(const Hash& leaf, const Proof& proof, const Hash& root, const HashFn& hash_fn) {
    return verify_proof(leaf, proof, root, hash_fn);
  }
}
