#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "hv/security/secure_buffer.h"

namespace hv::crypto {

using security::SecureBuffer;

namespace alg {
inline constexpr std::string_view kX25519{"X25519"};
inline constexpr std::string_view kX448{"X448"};
inline constexpr std::string_view kMlKem512{"ML-KEM-512"};
inline constexpr std::string_view kMlKem768{"ML-KEM-768"};
inline constexpr std::string_view kMlKem1024{"ML-KEM-1024"};
inline constexpr std::string_view kAes256Gcm{"AES256GCM"};
inline constexpr std::string_view kAes128Gcm{"AES128GCM"};
inline constexpr std::string_view kChaCha20Poly1305{"CHACHA20POLY1305"};
inline constexpr std::string_view kHkdfSha256{"HKDF-SHA256"};
inline constexpr std::string_view kHkdfSha3_512{"HKDF-SHA3-512"};
inline constexpr std::string_view kArgon2id{"Argon2id"};
inline constexpr std::string_view kPbkdf2Sha256{"PBKDF2-HMAC-SHA256"};
}  // namespace alg

enum class AlgorithmKind { kClassicalKem, kPqcKem, kAead, kKdf, kPbkdf };

struct KemSizes {
  size_t public_key{0};
  size_t secret_key{0};
  size_t ciphertext{0};
  size_t shared_secret{0};
  size_t seed{0};
};

struct KemKeyPair {
  std::vector<uint8_t> public_key;
  SecureBuffer<uint8_t> secret_key;
};

struct KemEncapsulation {
  std::vector<uint8_t> ciphertext;
  SecureBuffer<uint8_t> shared_secret;
};

struct AeadResult {
  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> tag;
};

struct PbkdfParams {
  std::string algorithm{std::string(alg::kArgon2id)};
  uint32_t time_cost{3};
  uint32_t memory_cost_kib{64 * 1024};
  uint32_t parallelism{4};
  uint32_t iterations{600'000}; // PBKDF2 only
  uint32_t output_length{64};
};

inline constexpr size_t kAeadNonceSize = 12;
inline constexpr size_t kAeadTagSize = 16;

}  // namespace hv::crypto
