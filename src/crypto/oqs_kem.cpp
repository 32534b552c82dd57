#include "hv/crypto/oqs_kem.h"

#include <array>
#include <memory>
#include <string>

#include <oqs/oqs.h>

#include "hv/crypto/seeded_rng.h"
#include "hv/error.h"
#include "hv/errors.h"

namespace hv::crypto {

namespace {

constexpr size_t kKeygenSeedSize = 32;

struct KemAlias {
  std::string_view name;
  const char* oqs_name;
};

constexpr std::array<KemAlias, 6> kKemAliases{{
    {"ML-KEM-512", OQS_KEM_alg_ml_kem_512},
    {"ML-KEM-768", OQS_KEM_alg_ml_kem_768},
    {"ML-KEM-1024", OQS_KEM_alg_ml_kem_1024},
    {"Kyber512", OQS_KEM_alg_ml_kem_512},
    {"Kyber768", OQS_KEM_alg_ml_kem_768},
    {"Kyber1024", OQS_KEM_alg_ml_kem_1024},
}};

using KemPtr = std::unique_ptr<OQS_KEM, decltype(&OQS_KEM_free)>;

KemPtr MakeKem(std::string_view name) {
  auto resolved = ResolveOqsKemName(name);
  if (!resolved) {
    throw AlgorithmUnavailableError(std::string(name));
  }
  OQS_KEM* raw = OQS_KEM_new(resolved->c_str());
  if (!raw) {
    throw AlgorithmUnavailableError(std::string(name));
  }
  return KemPtr(raw, &OQS_KEM_free);
}

void ThrowIfRandomnessFailed() {
  if (ConsumeOqsRandomnessFailure()) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kRandomFailure,
                "Randomness source failed during PQC operation");
  }
}

}  // namespace

std::optional<std::string> ResolveOqsKemName(std::string_view name) {
  for (const auto& alias : kKemAliases) {
    if (alias.name == name) {
      if (OQS_KEM_alg_is_enabled(alias.oqs_name) != 1) {
        return std::nullopt;
      }
      return std::string(alias.oqs_name);
    }
  }
  return std::nullopt;
}

KemSizes OqsKemSizes(std::string_view name) {
  auto kem = MakeKem(name);
  return KemSizes{kem->length_public_key, kem->length_secret_key, kem->length_ciphertext,
                  kem->length_shared_secret, kKeygenSeedSize};
}

KemKeyPair OqsKemKeypair(std::string_view name, std::span<const uint8_t> seed) {
  auto kem = MakeKem(name);
  if (!seed.empty() && seed.size() != kKeygenSeedSize) {
    throw InvalidKeyError("PQC keygen seed length mismatch");
  }
  InstallOqsRandomnessHook();
  ConsumeOqsRandomnessFailure();

  KemKeyPair pair;
  pair.public_key.resize(kem->length_public_key);
  pair.secret_key = SecureBuffer<uint8_t>(kem->length_secret_key);
  OQS_STATUS status = OQS_ERROR;
  if (seed.empty()) {
    status = OQS_KEM_keypair(kem.get(), pair.public_key.data(), pair.secret_key.data());
  } else {
    SeededOqsRandomness stream(seed);
    status = OQS_KEM_keypair(kem.get(), pair.public_key.data(), pair.secret_key.data());
  }
  ThrowIfRandomnessFailed();
  if (status != OQS_SUCCESS) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "OQS_KEM_keypair failed");
  }
  return pair;
}

KemEncapsulation OqsKemEncapsulate(std::string_view name, std::span<const uint8_t> public_key) {
  auto kem = MakeKem(name);
  if (public_key.size() != kem->length_public_key) {
    throw InvalidKeyError(std::string(name) + " public key length mismatch");
  }
  InstallOqsRandomnessHook();
  ConsumeOqsRandomnessFailure();

  KemEncapsulation result;
  result.ciphertext.resize(kem->length_ciphertext);
  result.shared_secret = SecureBuffer<uint8_t>(kem->length_shared_secret);
  const OQS_STATUS status = OQS_KEM_encaps(kem.get(), result.ciphertext.data(),
                                           result.shared_secret.data(), public_key.data());
  ThrowIfRandomnessFailed();
  if (status != OQS_SUCCESS) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "OQS_KEM_encaps failed");
  }
  return result;
}

SecureBuffer<uint8_t> OqsKemDecapsulate(std::string_view name,
                                        std::span<const uint8_t> secret_key,
                                        std::span<const uint8_t> ciphertext) {
  auto kem = MakeKem(name);
  if (secret_key.size() != kem->length_secret_key) {
    throw InvalidKeyError(std::string(name) + " private key length mismatch");
  }
  if (ciphertext.size() != kem->length_ciphertext) {
    throw FormatMismatchError(std::string(name) + " ciphertext length mismatch");
  }
  SecureBuffer<uint8_t> shared(kem->length_shared_secret);
  // ML-KEM decapsulation rejects implicitly: a forged ciphertext yields an
  // unrelated secret and is caught by the AEAD tag.
  if (OQS_KEM_decaps(kem.get(), shared.data(), ciphertext.data(), secret_key.data()) !=
      OQS_SUCCESS) {
    throw AuthenticationError(std::string(errors::msg::kDecapsulationFailed));
  }
  return shared;
}

}  // namespace hv::crypto
