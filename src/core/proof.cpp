#include "canopy/core/proof.hpp"
#include "canopy/core/errors.hpp"
#include "canopy/core/serializer.hpp"

namespace canopy::core {
  static constexpr uint32_t UNBOUNDED_WIRE = 0xFFFFFFFFu;
  static constexpr uint8_t SIDE_LEFT = 0;
  static constexpr uint8_t SIDE_RIGHT = 1;

  void Proof::push_back(const Node& node) {
    if (full()) throw CapacityExceededError(capacity_);
    nodes_.push_back(node);
  }

  const Node& Proof::at(size_t index) const {
    if (index >= nodes_.size()) throw IndexOutOfRangeError(index, nodes_.size());
    return nodes_[index];
  }

  std::vector<uint8_t> Proof::serialize() const {
    ByteWriter writer;
    uint32_t wire_capacity = capacity_ >= UNBOUNDED_WIRE ? UNBOUNDED_WIRE : static_cast<uint32_t>(capacity_);
    writer.write_u32(wire_capacity);
    writer.write_u32(static_cast<uint32_t>(nodes_.size()));
    for (const auto& node : nodes_) {
      writer.write_hash(node.data);
      writer.write_u8(node.side == Side::Right ? SIDE_RIGHT : SIDE_LEFT);
    }
    return writer.take();
  }

  Proof Proof::deserialize(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    uint32_t wire_capacity = reader.read_u32();
    uint32_t len = reader.read_u32();
    if (len > wire_capacity) throw SerializeError("deserialize: proof length exceeds capacity");

    Proof proof(wire_capacity == UNBOUNDED_WIRE ? UNBOUNDED : static_cast<size_t>(wire_capacity));
    for (uint32_t i = 0; i < len; ++i) {
      Node node;
      node.data = reader.read_hash();
      uint8_t side = reader.read_u8();
      if (side == SIDE_LEFT) node.side = Side::Left;
      else if (side == SIDE_RIGHT) node.side = Side::Right;
      else throw SerializeError("deserialize: invalid side byte");
      proof.nodes_.push_back(node);
    }
    reader.expect_end();
    return proof;
  }
}
