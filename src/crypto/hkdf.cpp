#include "hv/crypto/hkdf.h"

#include <memory>
#include <string>

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include "hv/error.h"

namespace hv::crypto {

SecureBuffer<uint8_t> HKDF_Derive(HkdfDigest digest,
                                  std::span<const uint8_t> ikm,
                                  std::span<const uint8_t> salt,
                                  std::span<const uint8_t> info,
                                  size_t length) {
  const EVP_MD* md = digest == HkdfDigest::kSha256 ? EVP_sha256() : EVP_sha3_512();
  const size_t max_length = 255U * static_cast<size_t>(EVP_MD_get_size(md));
  if (length == 0 || length > max_length) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "HKDF output length out of range");
  }

  EVP_PKEY_CTX* raw_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (!raw_ctx) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF) failed");
  }
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(raw_ctx, &EVP_PKEY_CTX_free);

  auto check = [](int status, const char* step) {
    if (status <= 0) {
      throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                  std::string("HKDF step failed: ") + step);
    }
  };

  check(EVP_PKEY_derive_init(ctx.get()), "derive_init");
  check(EVP_PKEY_CTX_set_hkdf_md(ctx.get(), md), "set_md");
  if (!salt.empty()) {
    check(EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())),
          "set_salt");
  }
  check(EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())),
        "set_key");
  if (!info.empty()) {
    check(EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())),
          "set_info");
  }

  SecureBuffer<uint8_t> out(length);
  size_t out_len = out.size();
  check(EVP_PKEY_derive(ctx.get(), out.data(), &out_len), "derive");
  if (out_len != length) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "HKDF derive produced unexpected length");
  }
  return out;
}

}  // namespace hv::crypto
