#include "hv/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

#include "hv/platform/memory_lock.h"

namespace hv::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
    switch (hv::platform::LockMemory(data.data(), data.size())) {
    case hv::platform::MemoryLockStatus::kLocked:
      return LockStatus::Locked;
    case hv::platform::MemoryLockStatus::kBestEffort:
      return LockStatus::BestEffort;
    case hv::platform::MemoryLockStatus::kUnsupported:
      break;
    }
    return LockStatus::Unsupported;
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    hv::platform::UnlockMemory(data.data(), data.size());
  }

} // namespace hv::security
