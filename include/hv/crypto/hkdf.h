#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "hv/crypto/types.h"

namespace hv::crypto {

enum class HkdfDigest { kSha256, kSha3_512 };

// RFC 5869 extract-and-expand. |length| may not exceed 255 digest blocks.
SecureBuffer<uint8_t> HKDF_Derive(HkdfDigest digest,
                                  std::span<const uint8_t> ikm,
                                  std::span<const uint8_t> salt,
                                  std::span<const uint8_t> info,
                                  size_t length);

}  // namespace hv::crypto
