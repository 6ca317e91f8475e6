#include "canopy/core/exclusion.hpp"
#include "canopy/core/errors.hpp"
#include <algorithm>
#include <functional>

namespace canopy::core {

  ExclusionProof make_exclusion_proof(const MerkleTree& tree, const Hash& target, ProofOptions options) {
    const auto& leaves = tree.leaves();
    if (std::adjacent_find(leaves.begin(), leaves.end(), std::greater_equal<Hash>()) != leaves.end()) {
      throw UnsortedInputError();
    }

    auto it = std::lower_bound(leaves.begin(), leaves.end(), target);
    if (it != leaves.end() && *it == target) throw LeafPresentError();

    ExclusionProof proof;
    size_t upper = static_cast<size_t>(it - leaves.begin());
    if (upper > 0) {
      size_t index = upper - 1;
      proof.left = Neighbor{leaves[index], index, tree.make_proof_at(index, options)};
    }
    if (upper < leaves.size()) {
      proof.right = Neighbor{leaves[upper], upper, tree.make_proof_at(upper, options)};
    }
    return proof;
  }

  static bool neighbor_included(const Neighbor& neighbor, const Hash& root, const HashFn& hash_fn) {
    return verify_proof(neighbor.leaf, neighbor.proof, root, hash_fn);
  }

  bool verify_exclusion_proof(const Hash& target, const ExclusionProof& proof, const Hash& root, const HashFn& hash_fn) {
    if (!proof.left || !proof.right) return false;
    if (!(proof.left->leaf < target && target < proof.right->leaf)) return false;
    return neighbor_included(*proof.left, root, hash_fn) && neighbor_included(*proof.right, root, hash_fn);
  }

  bool verify_exclusion_proof(const Hash& target, const ExclusionProof& proof, const Hash& root, const HashFn& hash_fn,
                              size_t leaf_count) {
    if (leaf_count == 0) return false;
    if (!proof.left && !proof.right) return false;

    if (proof.left) {
      const auto& left = *proof.left;
      if (!(left.leaf < target)) return false;
      if (!path_matches_index(left.proof, left.index, leaf_count)) return false;
      if (!neighbor_included(left, root, hash_fn)) return false;
    }
    if (proof.right) {
      const auto& right = *proof.right;
      if (!(target < right.leaf)) return false;
      if (!path_matches_index(right.proof, right.index, leaf_count)) return false;
      if (!neighbor_included(right, root, hash_fn)) return false;
    }

    if (proof.left && proof.right) return proof.right->index == proof.left->index + 1;
    if (proof.left) return proof.left->index == leaf_count - 1;
    return proof.right->index == 0;
  }
}
