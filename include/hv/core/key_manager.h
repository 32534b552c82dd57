#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "hv/core/key_material.h"
#include "hv/core/suite.h"
#include "hv/crypto/provider.h"

namespace hv::core {

inline constexpr size_t kPassphraseSaltSize = 16;
inline constexpr size_t kMaxKeyFileSize = 1024 * 1024;
inline constexpr std::string_view kExportFormatSpec{"ENCRYPTED_KEYS_AES256GCM_ARGON2ID"};

struct ExternalKeyPaths {
  std::filesystem::path classical_private;
  std::filesystem::path classical_public;  // optional; recomputed when empty
  std::filesystem::path pqc_private;
  std::filesystem::path pqc_public;
};

// Proof that the caller confirmed a private key export twice.
class ExportConfirmation {
 public:
  static ExportConfirmation Acknowledge(bool first, bool second) noexcept {
    return ExportConfirmation(first && second);
  }
  bool confirmed() const noexcept { return confirmed_; }

 private:
  explicit ExportConfirmation(bool confirmed) noexcept : confirmed_(confirmed) {}
  bool confirmed_{false};
};

class KeyManager {
 public:
  explicit KeyManager(std::shared_ptr<crypto::AlgorithmProvider> provider);

  // Argon2id/PBKDF2 stretch, then one HKDF expansion per KEM seed. The result
  // is a pure function of (passphrase, salt, suite).
  KeyMaterial DerivePassphraseKeys(std::string_view passphrase,
                                   std::span<const uint8_t> salt,
                                   const SuiteDefinition& suite) const;

  // Classical half only, for suites without a PQC KEM. Yields the same
  // classical keypair as DerivePassphraseKeys for equal inputs.
  crypto::KemKeyPair DeriveClassicalPassphraseKeys(std::string_view passphrase,
                                                   std::span<const uint8_t> salt,
                                                   const SuiteDefinition& suite) const;

  // Fresh random salt per call.
  KeyMaterial DeriveForEncryption(std::string_view passphrase, const SuiteDefinition& suite) const;

  KeyMaterial GenerateRandomKeys(const SuiteDefinition& suite) const;

  KeyMaterial LoadExternalKeys(const ExternalKeyPaths& paths, const SuiteDefinition& suite) const;

  std::vector<uint8_t> ExportPrivateKeys(const KeyMaterial& keys,
                                         std::string_view export_passphrase,
                                         const ExportConfirmation& confirmation) const;

  KeyMaterial ImportPrivateKeys(std::span<const uint8_t> container,
                                std::string_view export_passphrase,
                                const SuiteDefinition& suite) const;

  // Argon2id cost used for export containers. Only the cost fields are read.
  // Costs an import would refuse (above 1 GiB, 16 passes or 16 lanes) throw.
  void SetExportPbkdfParams(const crypto::PbkdfParams& params);

 private:
  std::shared_ptr<crypto::AlgorithmProvider> provider_;
  crypto::PbkdfParams export_pbkdf_{};
};

}  // namespace hv::core
