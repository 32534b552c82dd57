#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "hv/crypto/types.h"

namespace hv::crypto {

// Maps a suite-level PQC KEM name (including the Kyber aliases) to the liboqs
// identifier. Returns nullopt for unknown names or KEMs disabled in liboqs.
std::optional<std::string> ResolveOqsKemName(std::string_view name);

KemSizes OqsKemSizes(std::string_view name);

// A non-empty seed makes keygen deterministic.
KemKeyPair OqsKemKeypair(std::string_view name, std::span<const uint8_t> seed);
KemEncapsulation OqsKemEncapsulate(std::string_view name, std::span<const uint8_t> public_key);
SecureBuffer<uint8_t> OqsKemDecapsulate(std::string_view name,
                                        std::span<const uint8_t> secret_key,
                                        std::span<const uint8_t> ciphertext);

}  // namespace hv::crypto
