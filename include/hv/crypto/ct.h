#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace hv::crypto::ct {

// Length is not secret; contents are compared without early exit.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<uint8_t>(a[i] ^ b[i]);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace hv::crypto::ct
