#include "engine/core/hashing.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace plugplan {

namespace {

constexpr uint64_t kFnvPrime = 1099511628211ull;

uint64_t canonical_bits(double v) noexcept {
  if (std::isnan(v)) return std::bit_cast<uint64_t>(std::numeric_limits<double>::quiet_NaN());
  if (v == 0.0) return 0;
  return std::bit_cast<uint64_t>(v);
}

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) noexcept {
  const auto* p = static_cast<const unsigned char*>(data);
  for (size_t i = 0; p != nullptr && i < n; ++i) {
    h_ = (h_ ^ p[i]) * kFnvPrime;
  }
}

void Fnv1a64::update_u64(uint64_t v) noexcept {
  unsigned char le[8];
  for (int i = 0; i < 8; ++i) le[i] = static_cast<unsigned char>(v >> (8 * i));
  update_bytes(le, sizeof(le));
}

void Fnv1a64::update_bool(bool b) noexcept {
  const unsigned char byte = b ? 1 : 0;
  update_bytes(&byte, 1);
}

void Fnv1a64::update_string(std::string_view s) noexcept {
  update_u64(s.size());
  update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) noexcept {
  update_u64(canonical_bits(x));
}

Hash64 hash_text(std::string_view s) noexcept {
  Fnv1a64 h;
  h.update_string(s);
  return h.digest();
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (size_t i = 0; i < out.size(); ++i) {
    out[out.size() - 1 - i] = kHex[(h >> (4 * i)) & 0xF];
  }
  return out;
}

}  // namespace plugplan
