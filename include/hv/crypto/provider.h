#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hv/crypto/types.h"

namespace hv::crypto {

// Uniform access to the primitives a suite is built from. Every method
// resolves its algorithm by name and throws AlgorithmUnavailableError for
// names it does not provide; nothing is ever silently substituted.
class AlgorithmProvider {
public:
  virtual ~AlgorithmProvider() = default;

  virtual bool Supports(AlgorithmKind kind, std::string_view name) const noexcept = 0;

  virtual KemSizes DescribeClassicalKem(std::string_view name) const = 0;
  virtual KemSizes DescribePqcKem(std::string_view name) const = 0;
  virtual size_t AeadKeyLength(std::string_view name) const = 0;

  // An empty |seed| draws fresh randomness. A non-empty seed must be exactly
  // KemSizes::seed bytes and yields the same keypair on every call.
  virtual KemKeyPair GenerateClassicalKeypair(std::string_view name,
                                              std::span<const uint8_t> seed = {}) = 0;
  virtual std::vector<uint8_t> ClassicalPublicFromPrivate(std::string_view name,
                                                          std::span<const uint8_t> secret_key) = 0;
  virtual KemEncapsulation ClassicalEncapsulate(std::string_view name,
                                                std::span<const uint8_t> public_key) = 0;
  virtual SecureBuffer<uint8_t> ClassicalDecapsulate(std::string_view name,
                                                     std::span<const uint8_t> secret_key,
                                                     std::span<const uint8_t> ciphertext) = 0;

  virtual KemKeyPair GeneratePqcKeypair(std::string_view name,
                                        std::span<const uint8_t> seed = {}) = 0;
  virtual KemEncapsulation PqcEncapsulate(std::string_view name,
                                          std::span<const uint8_t> public_key) = 0;
  virtual SecureBuffer<uint8_t> PqcDecapsulate(std::string_view name,
                                               std::span<const uint8_t> secret_key,
                                               std::span<const uint8_t> ciphertext) = 0;

  virtual AeadResult AeadSeal(std::string_view name,
                              std::span<const uint8_t> key,
                              std::span<const uint8_t> nonce,
                              std::span<const uint8_t> plaintext,
                              std::span<const uint8_t> aad = {}) = 0;

  // Throws AuthenticationError when the tag does not verify.
  virtual std::vector<uint8_t> AeadOpen(std::string_view name,
                                        std::span<const uint8_t> key,
                                        std::span<const uint8_t> nonce,
                                        std::span<const uint8_t> ciphertext,
                                        std::span<const uint8_t> tag,
                                        std::span<const uint8_t> aad = {}) = 0;

  virtual SecureBuffer<uint8_t> KdfDerive(std::string_view name,
                                          std::span<const uint8_t> ikm,
                                          std::span<const uint8_t> salt,
                                          std::span<const uint8_t> info,
                                          size_t length) = 0;

  virtual SecureBuffer<uint8_t> PbkdfStretch(const PbkdfParams& params,
                                             std::span<const uint8_t> passphrase,
                                             std::span<const uint8_t> salt) = 0;

  virtual std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) = 0;
};

class OpenSslOqsProvider : public AlgorithmProvider {
public:
  bool Supports(AlgorithmKind kind, std::string_view name) const noexcept override;

  KemSizes DescribeClassicalKem(std::string_view name) const override;
  KemSizes DescribePqcKem(std::string_view name) const override;
  size_t AeadKeyLength(std::string_view name) const override;

  KemKeyPair GenerateClassicalKeypair(std::string_view name,
                                      std::span<const uint8_t> seed = {}) override;
  std::vector<uint8_t> ClassicalPublicFromPrivate(std::string_view name,
                                                  std::span<const uint8_t> secret_key) override;
  KemEncapsulation ClassicalEncapsulate(std::string_view name,
                                        std::span<const uint8_t> public_key) override;
  SecureBuffer<uint8_t> ClassicalDecapsulate(std::string_view name,
                                             std::span<const uint8_t> secret_key,
                                             std::span<const uint8_t> ciphertext) override;

  KemKeyPair GeneratePqcKeypair(std::string_view name,
                                std::span<const uint8_t> seed = {}) override;
  KemEncapsulation PqcEncapsulate(std::string_view name,
                                  std::span<const uint8_t> public_key) override;
  SecureBuffer<uint8_t> PqcDecapsulate(std::string_view name,
                                       std::span<const uint8_t> secret_key,
                                       std::span<const uint8_t> ciphertext) override;

  AeadResult AeadSeal(std::string_view name,
                      std::span<const uint8_t> key,
                      std::span<const uint8_t> nonce,
                      std::span<const uint8_t> plaintext,
                      std::span<const uint8_t> aad = {}) override;
  std::vector<uint8_t> AeadOpen(std::string_view name,
                                std::span<const uint8_t> key,
                                std::span<const uint8_t> nonce,
                                std::span<const uint8_t> ciphertext,
                                std::span<const uint8_t> tag,
                                std::span<const uint8_t> aad = {}) override;

  SecureBuffer<uint8_t> KdfDerive(std::string_view name,
                                  std::span<const uint8_t> ikm,
                                  std::span<const uint8_t> salt,
                                  std::span<const uint8_t> info,
                                  size_t length) override;

  SecureBuffer<uint8_t> PbkdfStretch(const PbkdfParams& params,
                                     std::span<const uint8_t> passphrase,
                                     std::span<const uint8_t> salt) override;

  std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) override;
};

std::shared_ptr<AlgorithmProvider> GetAlgorithmProviderShared();
AlgorithmProvider& GetAlgorithmProvider();
void SetAlgorithmProvider(std::shared_ptr<AlgorithmProvider> provider);
void EnsureAlgorithmProviderInitialized();
void ResetAlgorithmProviderForTesting();

}  // namespace hv::crypto
