#include "canopy/core/merkle.hpp"
#include "canopy/core/errors.hpp"
#include <algorithm>

namespace canopy::core {

  static std::vector<Hash> next_level(const std::vector<Hash>& level, const HashFn& hash_fn) {
    std::vector<Hash> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
      next.push_back(hash_fn(level[i], level[i + 1]));
    }
    if (level.size() % 2 == 1) next.push_back(level.back());
    return next;
  }

  Levels build_levels(const std::vector<Hash>& leaves, const HashFn& hash_fn) {
    if (leaves.empty()) throw EmptyInputError();
    Levels levels;
    levels.push_back(leaves);
    while (levels.back().size() > 1) {
      auto next = next_level(levels.back(), hash_fn);
      levels.push_back(std::move(next));
    }
    return levels;
  }

  Hash merkle_root(const std::vector<Hash>& leaves, const HashFn& hash_fn) {
    if (leaves.empty()) throw EmptyInputError();
    std::vector<Hash> level_hashes = leaves;
    while (level_hashes.size() > 1) {
      auto next = next_level(level_hashes, hash_fn);
      level_hashes.swap(next);
    }
    return level_hashes.front();
  }

  Proof proof_from_levels(const Levels& levels, size_t index, ProofOptions options) {
    if (levels.empty() || levels.front().empty()) throw EmptyInputError();
    if (index >= levels.front().size()) throw IndexOutOfRangeError(index, levels.front().size());

    std::vector<Node> path;
    size_t proof_index = index;
    for (size_t level = 0; level + 1 < levels.size(); ++level) {
      const auto& level_hashes = levels[level];
      size_t sibling_index = proof_index ^ 1;
      // No sibling: this is the carried-up element of an odd level.
      if (sibling_index < level_hashes.size()) {
        Side side = sibling_index > proof_index ? Side::Right : Side::Left;
        path.push_back({level_hashes[sibling_index], side});
      }
      proof_index /= 2;
    }

    if (path.size() > options.capacity) throw ProofCapacityExceededError(path.size(), options.capacity);

    Proof proof(options.capacity);
    for (const auto& node : path) proof.push_back(node);
    return proof;
  }

  Proof merkle_proof_at(const std::vector<Hash>& leaves, size_t index, const HashFn& hash_fn, ProofOptions options) {
    if (leaves.empty()) throw EmptyInputError();
    if (index >= leaves.size()) throw IndexOutOfRangeError(index, leaves.size());
    return proof_from_levels(build_levels(leaves, hash_fn), index, options);
  }

  Proof merkle_proof(const std::vector<Hash>& leaves, const Hash& leaf, const HashFn& hash_fn, ProofOptions options) {
    if (leaves.empty()) throw EmptyInputError();
    auto it = std::find(leaves.begin(), leaves.end(), leaf);
    if (it == leaves.end()) throw LeafNotFoundError();
    return merkle_proof_at(leaves, static_cast<size_t>(it - leaves.begin()), hash_fn, options);
  }

  Hash merkle_proof_check(const Proof& proof, const Hash& leaf, const HashFn& hash_fn) {
    Hash current_hash = leaf;
    for (const auto& node : proof) {
      if (node.side == Side::Right) {
        current_hash = hash_fn(current_hash, node.data);
      } else {
        current_hash = hash_fn(node.data, current_hash);
      }
    }
    return current_hash;
  }

  std::vector<Side> path_sides(size_t index, size_t leaf_count) {
    if (leaf_count == 0) throw EmptyInputError();
    if (index >= leaf_count) throw IndexOutOfRangeError(index, leaf_count);
    std::vector<Side> sides;
    size_t level_size = leaf_count;
    while (level_size > 1) {
      size_t sibling_index = index ^ 1;
      if (sibling_index < level_size) sides.push_back(sibling_index > index ? Side::Right : Side::Left);
      index /= 2;
      level_size = (level_size + 1) / 2;
    }
    return sides;
  }

  bool path_matches_index(const Proof& proof, size_t index, size_t leaf_count) {
    if (index >= leaf_count) return false;
    auto expected = path_sides(index, leaf_count);
    if (expected.size() != proof.len()) return false;
    for (size_t i = 0; i < expected.size(); ++i) {
      if (proof.at(i).side != expected[i]) return false;
    }
    return true;
  }

  size_t tree_height(size_t leaf_count) {
    size_t height = 0;
    while (leaf_count > 1) {
      leaf_count = (leaf_count + 1) / 2;
      ++height;
    }
    return height;
  }
}
