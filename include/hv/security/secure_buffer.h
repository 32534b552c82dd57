#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <new>
#include <span>

#include "hv/security/zeroizer.h"

namespace hv::security {

// Heap buffer for secret bytes. Pages are locked when the platform allows it
// and always zeroed before release.
template<typename T>
class SecureBuffer {
  T* ptr_{nullptr};
  size_t size_{0};
  size_t allocation_size_{0};
  bool locked_{false};

  void Release() noexcept {
    if (ptr_) {
      auto bytes_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_);
      Zeroizer::Wipe(bytes_span);
      if (locked_) {
        Zeroizer::UnlockMemory(bytes_span);
      }
      std::free(ptr_);
    }
    ptr_ = nullptr;
    size_ = 0;
    allocation_size_ = 0;
    locked_ = false;
  }

  static size_t RoundUpToAlignment(size_t value) {
    const size_t alignment = alignof(T);
    const size_t remainder = value % alignment;
    if (alignment <= 1U || remainder == 0U) {
      return value;
    }
    const size_t padding = alignment - remainder;
    if (value > (std::numeric_limits<size_t>::max() - padding)) {
      throw std::bad_array_new_length{};
    }
    return value + padding;
  }

public:
  SecureBuffer() noexcept = default;

  explicit SecureBuffer(size_t n) : size_(n) {
    if (n > 0 && n > (std::numeric_limits<size_t>::max() / sizeof(T))) {
      throw std::bad_array_new_length{};
    }
    const size_t bytes = n * sizeof(T);
    if (bytes == 0) {
      return;
    }
    allocation_size_ = RoundUpToAlignment(bytes);
    ptr_ = static_cast<T*>(std::aligned_alloc(alignof(T), allocation_size_));
    if (!ptr_) {
      throw std::bad_alloc{};
    }
    auto bytes_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_);
    Zeroizer::Wipe(bytes_span);
    locked_ = Zeroizer::TryLockMemory(bytes_span) == Zeroizer::LockStatus::Locked;
  }

  explicit SecureBuffer(std::span<const T> contents) : SecureBuffer(contents.size()) {
    std::copy(contents.begin(), contents.end(), ptr_);
  }

  ~SecureBuffer() { Release(); }
  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& o) noexcept
      : ptr_(o.ptr_), size_(o.size_), allocation_size_(o.allocation_size_), locked_(o.locked_) {
    o.ptr_ = nullptr;
    o.size_ = 0;
    o.allocation_size_ = 0;
    o.locked_ = false;
  }
  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = o.ptr_;
      size_ = o.size_;
      allocation_size_ = o.allocation_size_;
      locked_ = o.locked_;
      o.ptr_ = nullptr;
      o.size_ = 0;
      o.allocation_size_ = 0;
      o.locked_ = false;
    }
    return *this;
  }

  T* data() noexcept { return ptr_; }
  const T* data() const noexcept { return ptr_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<T> AsSpan() noexcept { return {ptr_, size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_, size_}; }
  std::span<uint8_t> AsU8Span() noexcept {
    return {reinterpret_cast<uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  std::span<const uint8_t> AsU8Span() const noexcept {
    return {reinterpret_cast<const uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  bool IsLocked() const noexcept { return locked_; }

  // Explicit deep copy; copies are never implicit for secret data.
  SecureBuffer Clone() const { return SecureBuffer(AsSpan()); }
};

} // namespace hv::security
