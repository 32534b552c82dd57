#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "hv/crypto/types.h"

namespace hv::crypto {

// Ephemeral-static Diffie-Hellman used as a KEM: the ciphertext is the
// sender's ephemeral public key.
enum class EcdhCurve { kX25519, kX448 };

KemSizes EcdhSizes(EcdhCurve curve) noexcept;

// With a seed the raw private key is the seed itself.
KemKeyPair EcdhKeypair(EcdhCurve curve, std::span<const uint8_t> seed);
std::vector<uint8_t> EcdhPublicFromPrivate(EcdhCurve curve, std::span<const uint8_t> secret_key);
KemEncapsulation EcdhEncapsulate(EcdhCurve curve, std::span<const uint8_t> public_key);
SecureBuffer<uint8_t> EcdhDecapsulate(EcdhCurve curve,
                                      std::span<const uint8_t> secret_key,
                                      std::span<const uint8_t> ciphertext);

}  // namespace hv::crypto
