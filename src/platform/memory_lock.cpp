#include "hv/platform/memory_lock.h"

#include <cerrno>

#if defined(_POSIX_VERSION) || defined(__unix__) || defined(__APPLE__)
#include <sys/mman.h>
#define HV_HAVE_MLOCK 1
#else
#define HV_HAVE_MLOCK 0
#endif

namespace hv::platform {

MemoryLockStatus LockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return MemoryLockStatus::kBestEffort;
  }
#if HV_HAVE_MLOCK
  if (::mlock(ptr, length) == 0) {
    return MemoryLockStatus::kLocked;
  }
  // RLIMIT_MEMLOCK exhaustion is common for unprivileged processes.
  if (errno == ENOSYS) {
    return MemoryLockStatus::kUnsupported;
  }
  return MemoryLockStatus::kBestEffort;
#else
  (void)ptr;
  (void)length;
  return MemoryLockStatus::kUnsupported;
#endif
}

void UnlockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return;
  }
#if HV_HAVE_MLOCK
  ::munlock(ptr, length);
#else
  (void)ptr;
  (void)length;
#endif
}

bool MemoryLockSupported() noexcept {
  return HV_HAVE_MLOCK != 0;
}

}  // namespace hv::platform
