#include "hv/platform/memory_lock.h"
#include "hv/security/secure_buffer.h"
#include "hv/security/zeroizer.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

void TestLockUnlock() {
  std::array<std::uint8_t, 64> buffer{};
  auto status = hv::platform::LockMemory(buffer.data(), buffer.size());
  if (status == hv::platform::MemoryLockStatus::kUnsupported) {
    return;  // unsupported platforms are accepted
  }
  assert(status == hv::platform::MemoryLockStatus::kLocked ||
         status == hv::platform::MemoryLockStatus::kBestEffort);
  hv::platform::UnlockMemory(buffer.data(), buffer.size());
}

void TestWipeHelpers() {
  std::vector<std::uint8_t> bytes(32, 0xAB);
  hv::security::Zeroizer::WipeVector(bytes);
  assert(std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; }));

  std::string secret = "passphrase";
  hv::security::Zeroizer::WipeString(secret);
  assert(std::all_of(secret.begin(), secret.end(), [](char c) { return c == '\0'; }));

  std::array<std::uint8_t, 16> scoped{};
  scoped.fill(0x5A);
  {
    hv::security::Zeroizer::ScopeWiper<std::uint8_t> wiper(scoped.data(), scoped.size());
  }
  assert(std::all_of(scoped.begin(), scoped.end(), [](std::uint8_t b) { return b == 0; }));

  scoped.fill(0x5A);
  {
    hv::security::Zeroizer::ScopeWiper<std::uint8_t> wiper(scoped.data(), scoped.size());
    wiper.Release();
  }
  assert(scoped[0] == 0x5A && "released wiper leaves the bytes alone");
}

void TestSecureBuffer() {
  const std::array<std::uint8_t, 4> contents = {1, 2, 3, 4};
  hv::security::SecureBuffer<std::uint8_t> buffer{std::span<const std::uint8_t>(contents)};
  assert(buffer.size() == 4);
  assert(std::equal(contents.begin(), contents.end(), buffer.data()));

  auto copy = buffer.Clone();
  assert(copy.data() != buffer.data());
  assert(std::equal(contents.begin(), contents.end(), copy.data()));

  auto moved = std::move(buffer);
  assert(moved.size() == 4);
  assert(buffer.empty() && buffer.data() == nullptr);

  hv::security::SecureBuffer<char> empty;
  assert(empty.empty() && empty.AsSpan().empty());
  hv::security::SecureBuffer<std::uint8_t> zeroed(8);
  assert(std::all_of(zeroed.data(), zeroed.data() + zeroed.size(), [](std::uint8_t b) { return b == 0; }));
}

}  // namespace

int main() {
  TestLockUnlock();
  TestWipeHelpers();
  TestSecureBuffer();
  std::cout << "memory lock test ok\n";
  return 0;
}
