#include "hv/crypto/ecdh_kem.h"

#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "hv/crypto/ct.h"
#include "hv/error.h"
#include "hv/errors.h"

namespace hv::crypto {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

[[noreturn]] void ThrowCryptoError(const std::string& message) {
  throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, message);
}

int PkeyId(EcdhCurve curve) noexcept {
  return curve == EcdhCurve::kX25519 ? EVP_PKEY_X25519 : EVP_PKEY_X448;
}

const char* CurveName(EcdhCurve curve) noexcept {
  return curve == EcdhCurve::kX25519 ? "X25519" : "X448";
}

PkeyPtr LoadPrivate(EcdhCurve curve, std::span<const uint8_t> secret_key) {
  if (secret_key.size() != EcdhSizes(curve).secret_key) {
    throw InvalidKeyError(std::string(CurveName(curve)) + " private key length mismatch");
  }
  PkeyPtr key(EVP_PKEY_new_raw_private_key(PkeyId(curve), nullptr, secret_key.data(),
                                           secret_key.size()),
              &EVP_PKEY_free);
  if (!key) {
    ERR_clear_error();
    throw InvalidKeyError(std::string(CurveName(curve)) + " private key rejected");
  }
  return key;
}

PkeyPtr LoadPublic(EcdhCurve curve, std::span<const uint8_t> public_key) {
  if (public_key.size() != EcdhSizes(curve).public_key) {
    throw InvalidKeyError(std::string(CurveName(curve)) + " public key length mismatch");
  }
  PkeyPtr key(EVP_PKEY_new_raw_public_key(PkeyId(curve), nullptr, public_key.data(),
                                          public_key.size()),
              &EVP_PKEY_free);
  if (!key) {
    ERR_clear_error();
    throw InvalidKeyError(std::string(CurveName(curve)) + " public key rejected");
  }
  return key;
}

std::vector<uint8_t> RawPublic(EcdhCurve curve, EVP_PKEY* key) {
  std::vector<uint8_t> out(EcdhSizes(curve).public_key);
  size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) <= 0 || len != out.size()) {
    ThrowCryptoError(std::string(CurveName(curve)) + ": get_raw_public_key failed");
  }
  return out;
}

SecureBuffer<uint8_t> RawPrivate(EcdhCurve curve, EVP_PKEY* key) {
  SecureBuffer<uint8_t> out(EcdhSizes(curve).secret_key);
  size_t len = out.size();
  if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) <= 0 || len != out.size()) {
    ThrowCryptoError(std::string(CurveName(curve)) + ": get_raw_private_key failed");
  }
  return out;
}

SecureBuffer<uint8_t> Derive(EcdhCurve curve, EVP_PKEY* own, EVP_PKEY* peer) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_derive_set_peer(ctx.get(), peer) <= 0) {
    ThrowCryptoError(std::string(CurveName(curve)) + ": derive init/set_peer failed");
  }
  SecureBuffer<uint8_t> secret(EcdhSizes(curve).shared_secret);
  size_t len = secret.size();
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &len) <= 0 || len != secret.size()) {
    ERR_clear_error();
    throw AuthenticationError(std::string(errors::msg::kDecapsulationFailed));
  }
  // A low-order peer point yields the all-zero secret.
  const std::vector<uint8_t> zeros(secret.size(), 0);
  if (ct::CompareEqual(secret.AsSpan(), zeros)) {
    throw AuthenticationError(std::string(errors::msg::kDecapsulationFailed));
  }
  return secret;
}

}  // namespace

KemSizes EcdhSizes(EcdhCurve curve) noexcept {
  const size_t n = curve == EcdhCurve::kX25519 ? 32 : 56;
  return KemSizes{n, n, n, n, n};
}

KemKeyPair EcdhKeypair(EcdhCurve curve, std::span<const uint8_t> seed) {
  PkeyPtr key(nullptr, &EVP_PKEY_free);
  if (!seed.empty()) {
    key = LoadPrivate(curve, seed);
  } else {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(PkeyId(curve), nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
      ThrowCryptoError(std::string(CurveName(curve)) + ": keygen_init failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
      ThrowCryptoError(std::string(CurveName(curve)) + ": keygen failed");
    }
    key.reset(raw);
  }
  KemKeyPair pair;
  pair.public_key = RawPublic(curve, key.get());
  pair.secret_key = RawPrivate(curve, key.get());
  return pair;
}

std::vector<uint8_t> EcdhPublicFromPrivate(EcdhCurve curve,
                                           std::span<const uint8_t> secret_key) {
  auto key = LoadPrivate(curve, secret_key);
  return RawPublic(curve, key.get());
}

KemEncapsulation EcdhEncapsulate(EcdhCurve curve, std::span<const uint8_t> public_key) {
  auto recipient = LoadPublic(curve, public_key);
  auto ephemeral = EcdhKeypair(curve, {});
  auto eph_key = LoadPrivate(curve, ephemeral.secret_key.AsSpan());

  KemEncapsulation result;
  result.ciphertext = std::move(ephemeral.public_key);
  result.shared_secret = Derive(curve, eph_key.get(), recipient.get());
  return result;
}

SecureBuffer<uint8_t> EcdhDecapsulate(EcdhCurve curve,
                                      std::span<const uint8_t> secret_key,
                                      std::span<const uint8_t> ciphertext) {
  auto own = LoadPrivate(curve, secret_key);
  if (ciphertext.size() != EcdhSizes(curve).ciphertext) {
    throw FormatMismatchError(std::string(CurveName(curve)) + " ciphertext length mismatch");
  }
  PkeyPtr peer(EVP_PKEY_new_raw_public_key(PkeyId(curve), nullptr, ciphertext.data(),
                                           ciphertext.size()),
               &EVP_PKEY_free);
  if (!peer) {
    ERR_clear_error();
    throw AuthenticationError(std::string(errors::msg::kDecapsulationFailed));
  }
  return Derive(curve, own.get(), peer.get());
}

}  // namespace hv::crypto
