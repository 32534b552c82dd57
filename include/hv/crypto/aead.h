#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "hv/crypto/types.h"

namespace hv::crypto {

enum class AeadCipher { kAes256Gcm, kAes128Gcm, kChaCha20Poly1305 };

size_t AeadKeySize(AeadCipher cipher) noexcept;

// Encrypts |plaintext| with a 12-byte nonce and returns the ciphertext and
// 16-byte tag. Throws hv::Error on provider failures.
AeadResult AeadEncrypt(AeadCipher cipher,
                       std::span<const uint8_t> key,
                       std::span<const uint8_t> nonce,
                       std::span<const uint8_t> plaintext,
                       std::span<const uint8_t> aad);

// Throws AuthenticationError on tag mismatch and hv::Error on other failures.
// No plaintext is released unless the tag verifies.
std::vector<uint8_t> AeadDecrypt(AeadCipher cipher,
                                 std::span<const uint8_t> key,
                                 std::span<const uint8_t> nonce,
                                 std::span<const uint8_t> ciphertext,
                                 std::span<const uint8_t> tag,
                                 std::span<const uint8_t> aad);

} // namespace hv::crypto
