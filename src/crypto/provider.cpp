#include "hv/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <oqs/oqs.h>

#if HV_HAVE_SODIUM
#include <sodium.h>
#endif

#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "hv/crypto/aead.h"
#include "hv/crypto/ct.h"
#include "hv/crypto/ecdh_kem.h"
#include "hv/crypto/hkdf.h"
#include "hv/crypto/oqs_kem.h"
#include "hv/crypto/pbkdf.h"
#include "hv/error.h"

namespace hv::crypto {

namespace {

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<AlgorithmProvider>& ProviderInstance() {
  static std::shared_ptr<AlgorithmProvider> instance;
  return instance;
}

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = errors::crypto::kProviderFailure) {
  throw Error(ErrorDomain::Crypto, code, message);
}

std::optional<EcdhCurve> ResolveCurve(std::string_view name) noexcept {
  if (name == alg::kX25519) {
    return EcdhCurve::kX25519;
  }
  if (name == alg::kX448) {
    return EcdhCurve::kX448;
  }
  return std::nullopt;
}

EcdhCurve RequireCurve(std::string_view name) {
  auto curve = ResolveCurve(name);
  if (!curve) {
    throw AlgorithmUnavailableError(std::string(name));
  }
  return *curve;
}

std::optional<AeadCipher> ResolveAead(std::string_view name) noexcept {
  if (name == alg::kAes256Gcm) {
    return AeadCipher::kAes256Gcm;
  }
  if (name == alg::kAes128Gcm) {
    return AeadCipher::kAes128Gcm;
  }
  if (name == alg::kChaCha20Poly1305) {
    return AeadCipher::kChaCha20Poly1305;
  }
  return std::nullopt;
}

AeadCipher RequireAead(std::string_view name) {
  auto cipher = ResolveAead(name);
  if (!cipher) {
    throw AlgorithmUnavailableError(std::string(name));
  }
  return *cipher;
}

std::optional<HkdfDigest> ResolveKdf(std::string_view name) noexcept {
  if (name == alg::kHkdfSha256) {
    return HkdfDigest::kSha256;
  }
  if (name == alg::kHkdfSha3_512) {
    return HkdfDigest::kSha3_512;
  }
  return std::nullopt;
}

// NIST SP 800-38D test case 16 (AES-256, 96-bit IV, 20-byte AAD).
void RunAesGcmKnownAnswerTest() {
  static constexpr std::array<uint8_t, 32> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, kAeadNonceSize> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce,
      0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x52, 0x2d, 0xc1, 0xf0, 0x99, 0x56, 0x7d, 0x07, 0xf4, 0x7f, 0x37, 0xa3,
      0x2a, 0x84, 0x42, 0x7d, 0x64, 0x3a, 0x8c, 0xdc, 0xbf, 0xe5, 0xc0, 0xc9,
      0x75, 0x98, 0xa2, 0xbd, 0x25, 0x55, 0xd1, 0xaa, 0x8c, 0xb0, 0x8e, 0x48,
      0x59, 0x0d, 0xbb, 0x3d, 0xa7, 0xb0, 0x8b, 0x10, 0x56, 0x82, 0x88, 0x38,
      0xc5, 0xf6, 0x1e, 0x63, 0x93, 0xba, 0x7a, 0x0a, 0xbc, 0xc9, 0xf6, 0x62};
  static constexpr std::array<uint8_t, kAeadTagSize> kExpectedTag{
      0x76, 0xfc, 0x6e, 0xce, 0x0f, 0x4e, 0x17, 0x68,
      0xcd, 0xdf, 0x88, 0x53, 0xbb, 0x2d, 0x55, 0x1b};

  const auto enc = AeadEncrypt(AeadCipher::kAes256Gcm, kKey, kNonce, kPlaintext, kAad);
  if (!ct::CompareEqual(enc.ciphertext, kExpectedCiphertext)) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch", errors::crypto::kKnownAnswerFailed);
  }
  if (!ct::CompareEqual(enc.tag, kExpectedTag)) {
    ThrowCryptoError("AES-GCM KAT tag mismatch", errors::crypto::kKnownAnswerFailed);
  }
  const auto dec = AeadDecrypt(AeadCipher::kAes256Gcm, kKey, kNonce, enc.ciphertext, enc.tag, kAad);
  if (!ct::CompareEqual(dec, kPlaintext)) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch", errors::crypto::kKnownAnswerFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if HV_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    OQS_init();
    std::clog << "[crypto] liboqs " << OQS_version() << " initialized" << std::endl;
    RunAesGcmKnownAnswerTest();
    state.kat_passed = true;
    std::clog << "[crypto] AES-GCM known-answer test passed" << std::endl;
  });
}

}  // namespace

void EnsureAlgorithmProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

bool OpenSslOqsProvider::Supports(AlgorithmKind kind, std::string_view name) const noexcept {
  switch (kind) {
  case AlgorithmKind::kClassicalKem:
    return ResolveCurve(name).has_value();
  case AlgorithmKind::kPqcKem:
    return ResolveOqsKemName(name).has_value();
  case AlgorithmKind::kAead:
    return ResolveAead(name).has_value();
  case AlgorithmKind::kKdf:
    return ResolveKdf(name).has_value();
  case AlgorithmKind::kPbkdf:
    return name == alg::kArgon2id || name == alg::kPbkdf2Sha256;
  }
  return false;
}

KemSizes OpenSslOqsProvider::DescribeClassicalKem(std::string_view name) const {
  return EcdhSizes(RequireCurve(name));
}

KemSizes OpenSslOqsProvider::DescribePqcKem(std::string_view name) const {
  return OqsKemSizes(name);
}

size_t OpenSslOqsProvider::AeadKeyLength(std::string_view name) const {
  return AeadKeySize(RequireAead(name));
}

KemKeyPair OpenSslOqsProvider::GenerateClassicalKeypair(std::string_view name,
                                                        std::span<const uint8_t> seed) {
  const auto curve = RequireCurve(name);
  if (!seed.empty() && seed.size() != EcdhSizes(curve).seed) {
    throw InvalidKeyError("Classical keygen seed length mismatch");
  }
  return EcdhKeypair(curve, seed);
}

std::vector<uint8_t> OpenSslOqsProvider::ClassicalPublicFromPrivate(
    std::string_view name, std::span<const uint8_t> secret_key) {
  return EcdhPublicFromPrivate(RequireCurve(name), secret_key);
}

KemEncapsulation OpenSslOqsProvider::ClassicalEncapsulate(std::string_view name,
                                                          std::span<const uint8_t> public_key) {
  return EcdhEncapsulate(RequireCurve(name), public_key);
}

SecureBuffer<uint8_t> OpenSslOqsProvider::ClassicalDecapsulate(
    std::string_view name, std::span<const uint8_t> secret_key,
    std::span<const uint8_t> ciphertext) {
  return EcdhDecapsulate(RequireCurve(name), secret_key, ciphertext);
}

KemKeyPair OpenSslOqsProvider::GeneratePqcKeypair(std::string_view name,
                                                  std::span<const uint8_t> seed) {
  return OqsKemKeypair(name, seed);
}

KemEncapsulation OpenSslOqsProvider::PqcEncapsulate(std::string_view name,
                                                    std::span<const uint8_t> public_key) {
  return OqsKemEncapsulate(name, public_key);
}

SecureBuffer<uint8_t> OpenSslOqsProvider::PqcDecapsulate(std::string_view name,
                                                         std::span<const uint8_t> secret_key,
                                                         std::span<const uint8_t> ciphertext) {
  return OqsKemDecapsulate(name, secret_key, ciphertext);
}

AeadResult OpenSslOqsProvider::AeadSeal(std::string_view name,
                                        std::span<const uint8_t> key,
                                        std::span<const uint8_t> nonce,
                                        std::span<const uint8_t> plaintext,
                                        std::span<const uint8_t> aad) {
  return AeadEncrypt(RequireAead(name), key, nonce, plaintext, aad);
}

std::vector<uint8_t> OpenSslOqsProvider::AeadOpen(std::string_view name,
                                                  std::span<const uint8_t> key,
                                                  std::span<const uint8_t> nonce,
                                                  std::span<const uint8_t> ciphertext,
                                                  std::span<const uint8_t> tag,
                                                  std::span<const uint8_t> aad) {
  return AeadDecrypt(RequireAead(name), key, nonce, ciphertext, tag, aad);
}

SecureBuffer<uint8_t> OpenSslOqsProvider::KdfDerive(std::string_view name,
                                                    std::span<const uint8_t> ikm,
                                                    std::span<const uint8_t> salt,
                                                    std::span<const uint8_t> info,
                                                    size_t length) {
  auto digest = ResolveKdf(name);
  if (!digest) {
    throw AlgorithmUnavailableError(std::string(name));
  }
  return HKDF_Derive(*digest, ikm, salt, info, length);
}

SecureBuffer<uint8_t> OpenSslOqsProvider::PbkdfStretch(const PbkdfParams& params,
                                                       std::span<const uint8_t> passphrase,
                                                       std::span<const uint8_t> salt) {
  if (params.algorithm == alg::kArgon2id) {
    return Argon2idDerive(passphrase, salt, params.time_cost, params.memory_cost_kib,
                          params.parallelism, params.output_length);
  }
  if (params.algorithm == alg::kPbkdf2Sha256) {
    return PBKDF2_HMAC_SHA256(passphrase, salt, params.iterations, params.output_length);
  }
  throw AlgorithmUnavailableError(params.algorithm);
}

std::array<uint8_t, 32> OpenSslOqsProvider::SHA256(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError("EVP_Digest(EVP_sha256) failed");
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length");
  }
  return out;
}

std::shared_ptr<AlgorithmProvider> GetAlgorithmProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSslOqsProvider>();
  }
  return provider;
}

AlgorithmProvider& GetAlgorithmProvider() {
  return *GetAlgorithmProviderShared();
}

void SetAlgorithmProvider(std::shared_ptr<AlgorithmProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetAlgorithmProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace hv::crypto
