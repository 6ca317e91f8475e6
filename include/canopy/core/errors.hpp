#pragma once
#include <stdexcept>
#include <string>

namespace canopy::core {

  // Base of every contract violation raised by the tree engine.
  struct MerkleError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // No leaves were supplied.
  struct EmptyInputError : MerkleError {
    EmptyInputError() : MerkleError("merkle: empty leaf set") {}
  };

  struct LeafNotFoundError : MerkleError {
    LeafNotFoundError() : MerkleError("merkle: leaf not found") {}
  };

  struct IndexOutOfRangeError : MerkleError {
    IndexOutOfRangeError(size_t index, size_t size)
      : MerkleError("merkle: index " + std::to_string(index) + " out of range (size " + std::to_string(size) + ")") {}
  };

  // The leaf's path needs more nodes than the requested proof capacity.
  struct ProofCapacityExceededError : MerkleError {
    ProofCapacityExceededError(size_t required, size_t capacity)
      : MerkleError("merkle: proof needs " + std::to_string(required) + " nodes, capacity is " + std::to_string(capacity)) {}
  };

  // push_back on a full Proof.
  struct CapacityExceededError : MerkleError {
    explicit CapacityExceededError(size_t capacity)
      : MerkleError("proof: capacity " + std::to_string(capacity) + " exceeded") {}
  };

  struct UnsortedInputError : MerkleError {
    UnsortedInputError() : MerkleError("exclusion: leaves are not strictly ascending") {}
  };

  struct LeafPresentError : MerkleError {
    LeafPresentError() : MerkleError("exclusion: target is a leaf of the tree") {}
  };
}
