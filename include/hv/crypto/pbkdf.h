#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "hv/crypto/types.h"

namespace hv::crypto {

SecureBuffer<uint8_t> Argon2idDerive(std::span<const uint8_t> passphrase,
                                     std::span<const uint8_t> salt,
                                     uint32_t time_cost,
                                     uint32_t memory_cost_kib,
                                     uint32_t parallelism,
                                     size_t length);

SecureBuffer<uint8_t> PBKDF2_HMAC_SHA256(std::span<const uint8_t> passphrase,
                                         std::span<const uint8_t> salt,
                                         uint32_t iterations,
                                         size_t length);

}  // namespace hv::crypto
