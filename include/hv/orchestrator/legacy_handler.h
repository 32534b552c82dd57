#pragma once

#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "hv/core/key_manager.h"
#include "hv/core/suite.h"
#include "hv/crypto/provider.h"
#include "hv/orchestrator/crypto_handler.h"

namespace hv::orchestrator {

inline constexpr const char* kLegacySuiteId = "CLASSICAL_X25519_AES256GCM";
inline constexpr std::string_view kLegacyKdfLabel{"hv-legacy-classical/v1"};

// Host-supplied bridge for OpenPGP payloads (for example a gpg-agent call).
// Throws AuthenticationError on a wrong key.
using ExternalDecryptor =
    std::function<std::vector<uint8_t>(std::span<const uint8_t> raw, const KeySource& key_source)>;

bool LooksLikeOpenPgp(std::span<const uint8_t> raw) noexcept;

// The suite the classical-only format was produced with.
core::SuiteDefinition LegacySuiteDefinition();

// Decrypt-only support for data written before hybrid suites existed.
class LegacyClassicalHandler : public CryptoHandler {
 public:
  explicit LegacyClassicalHandler(std::shared_ptr<crypto::AlgorithmProvider> provider,
                                  ExternalDecryptor external = {});

  const std::string& SuiteId() const noexcept override { return suite_.id; }

  bool CanHandle(std::span<const uint8_t> raw) const noexcept override;

  // Always throws UnsupportedOperationError.
  core::Bundle Encrypt(std::span<const uint8_t> plaintext, const core::KeyMaterial& keys) override;

  DecryptAttempt Decrypt(std::span<const uint8_t> raw, const KeySource& key_source) override;

 private:
  DecryptAttempt DecryptOpenPgp(std::span<const uint8_t> raw, const KeySource& key_source);

  core::SuiteDefinition suite_;
  std::shared_ptr<crypto::AlgorithmProvider> provider_;
  core::KeyManager key_manager_;
  ExternalDecryptor external_;
};

}  // namespace hv::orchestrator
