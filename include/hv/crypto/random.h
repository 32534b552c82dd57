#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace hv::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

inline std::vector<uint8_t> RandomVector(size_t length) {
  std::vector<uint8_t> out(length);
  SystemRandomBytes(out);
  return out;
}

}  // namespace hv::crypto
