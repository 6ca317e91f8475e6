#pragma once
#include <cstdint>
#include <limits>
#include <span>
#include <vector>
#include "canopy/core/hash.hpp"

namespace canopy::core {

  // Operand position the sibling took when it was combined.
  enum class Side : uint8_t {
    Left = 0,
    Right = 1,
  };

  struct Node {
    Hash data{};
    Side side = Side::Left;

    bool operator==(const Node&) const = default;
  };

  // Bottom-up sibling path from a leaf to the root. The capacity is an optional
  // ceiling chosen at request time; a default-constructed proof is unbounded.
  class Proof {
    public:
      static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

      Proof() = default;
      explicit Proof(size_t capacity) : capacity_(capacity) {}

      // Throws CapacityExceededError once len() == capacity().
      void push_back(const Node& node);

      // Throws IndexOutOfRangeError for index >= len().
      const Node& at(size_t index) const;

      size_t len() const { return nodes_.size(); }
      size_t capacity() const { return capacity_; }
      bool empty() const { return nodes_.empty(); }
      bool full() const { return nodes_.size() == capacity_; }
      bool bounded() const { return capacity_ != UNBOUNDED; }

      const std::vector<Node>& nodes() const { return nodes_; }
      auto begin() const { return nodes_.begin(); }
      auto end() const { return nodes_.end(); }

      bool operator==(const Proof&) const = default;

      // u32 capacity | u32 len | len * (32-byte data | u8 side), little-endian.
      std::vector<uint8_t> serialize() const;
      static Proof deserialize(std::span<const uint8_t> bytes);

    private:
      size_t capacity_ = UNBOUNDED;
      std::vector<Node> nodes_;
  };
}
