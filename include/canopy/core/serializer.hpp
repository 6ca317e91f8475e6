#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include <stdexcept>
#include <type_traits>
#include "canopy/core/hash.hpp"

namespace canopy::core {

  struct SerializeError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Little-endian writer for proof encodings.
  class ByteWriter {
    public:
      void write_u8(uint8_t value) { buffer_.push_back(value); }
      void write_u32(uint32_t value) { write_le_value(value); }

      void write_raw(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
      }
      void write_hash(const Hash& hash) {
        write_raw(std::span<const uint8_t>(hash.data(), hash.size()));
      }

      const std::vector<uint8_t>& buffer() const { return buffer_; }
      std::vector<uint8_t> take() { return std::move(buffer_); }

    private:
      template <class T> void write_le_value(T value) {
        for (size_t i = 0; i < sizeof(T); ++i) buffer_.push_back(static_cast<uint8_t>((value >> (8*i)) & 0xFF));
      }
      std::vector<uint8_t> buffer_;
  };

  class ByteReader {
    public:
      explicit ByteReader(std::span<const uint8_t> src) : src_(src) {}

      uint8_t read_u8() { return read_value<uint8_t>(); }
      uint32_t read_u32() { return read_value<uint32_t>(); }

      Hash read_hash() {
        Hash out{};
        ensure(remaining_bytes() >= out.size());
        for (size_t i = 0; i < out.size(); ++i) out[i] = src_[pos_++];
        return out;
      }

      size_t remaining_bytes() const { return src_.size() - pos_; }

      void expect_end() const {
        if (remaining_bytes() != 0) throw SerializeError("deserialize: trailing bytes");
      }

    private:
      template <class T> T read_value() {
        ensure(remaining_bytes() >= sizeof(T));
        static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>, "T must be unsigned integral");
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
          value |= (static_cast<T>(src_[pos_++]) << (8 * i));
        }
        return value;
      }
      void ensure(bool condition) const { if (!condition) throw SerializeError("deserialize: truncated/invalid buffer");}

      std::span<const uint8_t> src_;
      size_t pos_ = 0;
  };
}
