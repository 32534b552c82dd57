#include "hv/crypto/aead.h"

#include <limits>
#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "hv/error.h"
#include "hv/errors.h"
#include "hv/security/zeroizer.h"

namespace hv::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(context) + ": " + buf;
}

[[noreturn]] void ThrowCryptoError(const std::string& message) {
  throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, message);
}

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const EVP_CIPHER* ResolveCipher(AeadCipher cipher) {
  switch (cipher) {
  case AeadCipher::kAes256Gcm:
    return EVP_aes_256_gcm();
  case AeadCipher::kAes128Gcm:
    return EVP_aes_128_gcm();
  case AeadCipher::kChaCha20Poly1305:
    return EVP_chacha20_poly1305();
  }
  return nullptr;
}

void ValidateInputs(AeadCipher cipher, std::span<const uint8_t> key,
                    std::span<const uint8_t> nonce, size_t data_size) {
  if (key.size() != AeadKeySize(cipher)) {
    throw InvalidKeyError("AEAD key length mismatch");
  }
  if (nonce.size() != kAeadNonceSize) {
    throw FormatMismatchError("AEAD nonce length mismatch");
  }
  if (data_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    ThrowCryptoError("AEAD input exceeds maximum size");
  }
}

CipherCtxPtr InitContext(AeadCipher cipher, std::span<const uint8_t> key,
                         std::span<const uint8_t> nonce, bool encrypt) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AEAD context");
  }
  const int enc = encrypt ? 1 : 0;
  if (EVP_CipherInit_ex(ctx.get(), ResolveCipher(cipher), nullptr, nullptr, nullptr, enc) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CipherInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_IVLEN"));
  }
  if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CipherInit_ex key/iv"));
  }
  return ctx;
}

}  // namespace

size_t AeadKeySize(AeadCipher cipher) noexcept {
  return cipher == AeadCipher::kAes128Gcm ? 16 : 32;
}

AeadResult AeadEncrypt(AeadCipher cipher,
                       std::span<const uint8_t> key,
                       std::span<const uint8_t> nonce,
                       std::span<const uint8_t> plaintext,
                       std::span<const uint8_t> aad) {
  ValidateInputs(cipher, key, nonce, plaintext.size());
  auto ctx = InitContext(cipher, key, nonce, true);

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AeadResult result;
  result.ciphertext.resize(plaintext.size());
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  result.tag.resize(kAeadTagSize);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(kAeadTagSize), result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_GET_TAG"));
  }
  return result;
}

std::vector<uint8_t> AeadDecrypt(AeadCipher cipher,
                                 std::span<const uint8_t> key,
                                 std::span<const uint8_t> nonce,
                                 std::span<const uint8_t> ciphertext,
                                 std::span<const uint8_t> tag,
                                 std::span<const uint8_t> aad) {
  ValidateInputs(cipher, key, nonce, ciphertext.size());
  if (tag.size() != kAeadTagSize) {
    throw AuthenticationError(std::string(errors::msg::kAuthenticationFailed));
  }
  auto ctx = InitContext(cipher, key, nonce, false);

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  std::vector<uint8_t> plaintext(ciphertext.size());
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()),
                          const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_TAG"));
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &final_len) <= 0) {
    security::Zeroizer::WipeVector(plaintext);
    ERR_clear_error();
    throw AuthenticationError(std::string(errors::msg::kAuthenticationFailed));
  }
  total += final_len;
  plaintext.resize(static_cast<size_t>(total));
  return plaintext;
}

}  // namespace hv::crypto
