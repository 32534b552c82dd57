#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace hv::crypto {

// Deterministic byte stream (SHA3-512 in counter mode) that liboqs draws its
// randomness from while an instance is alive on the current thread. Other
// threads keep using system randomness.
class SeededOqsRandomness {
 public:
  explicit SeededOqsRandomness(std::span<const uint8_t> seed);
  SeededOqsRandomness(const SeededOqsRandomness&) = delete;
  SeededOqsRandomness& operator=(const SeededOqsRandomness&) = delete;
  ~SeededOqsRandomness();

  static SeededOqsRandomness* Current() noexcept;

  void Generate(uint8_t* out, size_t len) noexcept;

 private:
  static SeededOqsRandomness*& Instance() noexcept;
  void Refill() noexcept;

  SeededOqsRandomness* previous_{nullptr};
  std::array<uint8_t, 64> key_{};
  std::array<uint8_t, 64> block_{};
  size_t block_index_{0};
  uint64_t counter_{0};
};

// Routes liboqs randomness through the thread-local seeded stream when one is
// active. Safe to call repeatedly.
void InstallOqsRandomnessHook();

// Clears and returns whether randomness generation failed on this thread
// since the last call.
bool ConsumeOqsRandomnessFailure() noexcept;

}  // namespace hv::crypto
