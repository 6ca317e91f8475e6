#include "canopy/core/hash.hpp"
#include "canopy/core/serializer.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <span>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include <vector>

namespace canopy::core {
  auto toHex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  std::vector<uint8_t> from_hex(std::string_view hex) {
    if (hex.rfind("0x", 0) == 0) hex.remove_prefix(2);
    if (hex.size() % 2 != 0) throw SerializeError("from_hex: odd number of hex characters");
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
      int hi = hex_value(hex[i]);
      int lo = hex_value(hex[i + 1]);
      if (hi < 0 || lo < 0) throw SerializeError("from_hex: invalid hex character");
      out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
  }

  Hash hash_from_hex(std::string_view hex) {
    auto bytes = from_hex(hex);
    Hash out{};
    if (bytes.size() != out.size()) throw SerializeError("hash_from_hex: expected 32 bytes");
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
  }

  auto sha256(std::span<const uint8_t> data) -> Hash {
    Hash out{};
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
    unsigned int len = static_cast<unsigned int>(out.size());
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) throw std::runtime_error("sha256: digest failed");
    return out;
  }

  auto hash_concat(std::span<const uint8_t> left, std::span<const uint8_t> right) -> Hash {
    std::vector<uint8_t> combined;
    combined.reserve(left.size() + right.size());
    combined.insert(combined.end(), left.begin(), left.end());
    combined.insert(combined.end(), right.begin(), right.end());
    return sha256(std::span<const uint8_t>(combined.data(), combined.size()));
  }
}
