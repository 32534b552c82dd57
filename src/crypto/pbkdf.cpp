#include "hv/crypto/pbkdf.h"

#include <algorithm>
#include <string>

#include <argon2.h>
#include <openssl/evp.h>

#include "hv/error.h"
#include "hv/errors.h"

namespace hv::crypto {

namespace {
constexpr size_t kMinArgon2Salt = 8;
constexpr size_t kMaxDerivedLength = 1024;
}

SecureBuffer<uint8_t> Argon2idDerive(std::span<const uint8_t> passphrase,
                                     std::span<const uint8_t> salt,
                                     uint32_t time_cost,
                                     uint32_t memory_cost_kib,
                                     uint32_t parallelism,
                                     size_t length) {
  if (length < 16 || length > kMaxDerivedLength || salt.size() < kMinArgon2Salt ||
      time_cost == 0 || parallelism == 0 || memory_cost_kib < 8 * parallelism) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                std::string(errors::msg::kUnsupportedArgon2Parameters)};
  }
  SecureBuffer<uint8_t> out(length);
  const int rc = argon2id_hash_raw(time_cost, memory_cost_kib, parallelism,
                                   passphrase.data(), passphrase.size(),
                                   salt.data(), salt.size(),
                                   out.data(), out.size());
  if (rc != ARGON2_OK) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                std::string(errors::msg::kArgon2DerivationFailed) + ": " +
                    argon2_error_message(rc),
                rc};
  }
  return out;
}

SecureBuffer<uint8_t> PBKDF2_HMAC_SHA256(std::span<const uint8_t> passphrase,
                                         std::span<const uint8_t> salt,
                                         uint32_t iterations,
                                         size_t length) {
  if (length == 0 || length > kMaxDerivedLength) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                std::string(errors::msg::kPbkdf2DerivationFailed)};
  }
  iterations = std::max<uint32_t>(iterations, 1u);
  SecureBuffer<uint8_t> out(length);
  if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(passphrase.data()),
                        static_cast<int>(passphrase.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(out.size()), out.data()) != 1) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                std::string(errors::msg::kPbkdf2DerivationFailed)};
  }
  return out;
}

}  // namespace hv::crypto
