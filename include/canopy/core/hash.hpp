#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace canopy::core {
  using Hash = std::array<uint8_t, 32>;

  // Caller-supplied two-to-one combiner. Must be deterministic and total.
  using HashFn = std::function<Hash(const Hash& left, const Hash& right)>;

  auto sha256(std::span<const uint8_t> data) -> Hash;
  auto hash_concat(std::span<const uint8_t> left, std::span<const uint8_t> right) -> Hash;

  inline auto sha256(const std::string& data) -> Hash {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  // SHA-256(left || right). A ready-made HashFn; the tree engine never calls it on its own.
  inline Hash sha256_pair(const Hash& left, const Hash& right) {
    return hash_concat(std::span<const uint8_t>(left.data(), left.size()),
                       std::span<const uint8_t>(right.data(), right.size()));
  }

  auto toHex(std::span<const uint8_t> data) -> std::string;
  inline std::string to_hex(std::span<const uint8_t> data) { return toHex(data); }
  inline std::string to_hex(const Hash& hash) { return toHex(std::span<const uint8_t>(hash.data(), hash.size())); }

  // Both accept an optional "0x" prefix and throw SerializeError on malformed input.
  std::vector<uint8_t> from_hex(std::string_view hex);
  Hash hash_from_hex(std::string_view hex);
}
