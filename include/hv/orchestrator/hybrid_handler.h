#pragma once

#include <memory>

#include "hv/core/key_manager.h"
#include "hv/core/suite.h"
#include "hv/crypto/provider.h"
#include "hv/orchestrator/crypto_handler.h"

namespace hv::orchestrator {

inline constexpr size_t kHybridSaltSize = 16;

// Throws AlgorithmUnavailableError naming the first algorithm of |suite| that
// |provider| lacks.
void RequireSuiteAvailable(const crypto::AlgorithmProvider& provider, const core::SuiteDefinition& suite);

// Classical KEM + PQC KEM, secrets concatenated and expanded through the
// suite's KDF into a single AEAD key.
class HybridCryptoHandler : public CryptoHandler {
 public:
  // Throws AlgorithmUnavailableError if the provider lacks any suite algorithm.
  HybridCryptoHandler(core::SuiteDefinition suite, std::shared_ptr<crypto::AlgorithmProvider> provider);

  const std::string& SuiteId() const noexcept override { return suite_.id; }
  const core::SuiteDefinition& Suite() const noexcept { return suite_; }

  bool CanHandle(std::span<const uint8_t> raw) const noexcept override;
  core::Bundle Encrypt(std::span<const uint8_t> plaintext, const core::KeyMaterial& keys) override;
  DecryptAttempt Decrypt(std::span<const uint8_t> raw, const KeySource& key_source) override;

 private:
  security::SecureBuffer<uint8_t> DeriveSymmetricKey(const security::SecureBuffer<uint8_t>& classical_secret,
                                                     const security::SecureBuffer<uint8_t>& pqc_secret,
                                                     std::span<const uint8_t> salt);
  std::vector<uint8_t> DecryptBundle(const core::Bundle& bundle, const core::KeyMaterial& keys);

  core::SuiteDefinition suite_;
  std::shared_ptr<crypto::AlgorithmProvider> provider_;
  core::KeyManager key_manager_;
};

}  // namespace hv::orchestrator
