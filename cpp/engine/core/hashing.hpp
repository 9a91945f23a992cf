#pragma once
/*
================================================================================
Fragment 1.5 — Core: Plan Fingerprint Hashing
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprints for compiled plans, so two runs over the same
    (facts, policy, settings) can be compared without diffing the JSON.

Rules:
  - FNV-1a over a little-endian byte stream; never std::hash.
  - Strings are length-prefixed, doubles hashed by bit pattern with -0.0
    folded into 0.0 and every NaN folded into one quiet NaN.
  - Not cryptographic.
================================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>

namespace plugplan {

using Hash64 = uint64_t;

class Fnv1a64 {
 public:
  Hash64 digest() const noexcept { return h_; }

  void update_bytes(const void* data, size_t n) noexcept;
  void update_u64(uint64_t v) noexcept;
  void update_i64(int64_t v) noexcept { update_u64(static_cast<uint64_t>(v)); }
  void update_bool(bool b) noexcept;
  void update_string(std::string_view s) noexcept;
  void update_f64(double x) noexcept;

 private:
  uint64_t h_ = 14695981039346656037ull;
};

Hash64 hash_text(std::string_view s) noexcept;

// 16 lowercase hex chars, most significant nibble first.
std::string hash_to_hex(Hash64 h);

}  // namespace plugplan
