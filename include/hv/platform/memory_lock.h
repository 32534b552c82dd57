#pragma once

#include <cstddef>

namespace hv::platform {

enum class MemoryLockStatus {
  kLocked,
  kBestEffort,
  kUnsupported,
};

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept;
void UnlockMemory(void* ptr, std::size_t length) noexcept;
bool MemoryLockSupported() noexcept;

}  // namespace hv::platform
