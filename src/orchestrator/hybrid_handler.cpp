#include "hv/orchestrator/hybrid_handler.h"

#include <algorithm>
#include <optional>
#include <utility>

#include "hv/common.h"
#include "hv/crypto/random.h"
#include "hv/error.h"
#include "hv/errors.h"

namespace hv::orchestrator {

namespace {

void RequireSupported(const crypto::AlgorithmProvider& provider, crypto::AlgorithmKind kind,
                      const std::string& name) {
  if (!provider.Supports(kind, name)) {
    throw AlgorithmUnavailableError(name);
  }
}

}  // namespace

void RequireSuiteAvailable(const crypto::AlgorithmProvider& provider, const core::SuiteDefinition& suite) {
  RequireSupported(provider, crypto::AlgorithmKind::kClassicalKem, suite.classical_kem);
  RequireSupported(provider, crypto::AlgorithmKind::kPqcKem, suite.pqc_kem);
  RequireSupported(provider, crypto::AlgorithmKind::kAead, suite.aead);
  RequireSupported(provider, crypto::AlgorithmKind::kKdf, suite.hybrid_kdf);
  RequireSupported(provider, crypto::AlgorithmKind::kKdf, suite.passphrase_kdf);
  RequireSupported(provider, crypto::AlgorithmKind::kPbkdf, suite.pbkdf.algorithm);
}

HybridCryptoHandler::HybridCryptoHandler(core::SuiteDefinition suite,
                                         std::shared_ptr<crypto::AlgorithmProvider> provider)
    : suite_(std::move(suite)), provider_(std::move(provider)), key_manager_(provider_) {
  RequireSuiteAvailable(*provider_, suite_);
}

bool HybridCryptoHandler::CanHandle(std::span<const uint8_t> raw) const noexcept {
  auto header = core::PeekBundleHeader(raw);
  return header && header->format_id == core::kHybridFormatId && header->suite_id == suite_.id;
}

security::SecureBuffer<uint8_t> HybridCryptoHandler::DeriveSymmetricKey(
    const security::SecureBuffer<uint8_t>& classical_secret,
    const security::SecureBuffer<uint8_t>& pqc_secret,
    std::span<const uint8_t> salt) {
  security::SecureBuffer<uint8_t> combined(classical_secret.size() + pqc_secret.size());
  std::copy(classical_secret.data(), classical_secret.data() + classical_secret.size(), combined.data());
  std::copy(pqc_secret.data(), pqc_secret.data() + pqc_secret.size(),
            combined.data() + classical_secret.size());
  return provider_->KdfDerive(suite_.hybrid_kdf, combined.AsSpan(), salt,
                              AsBytes(suite_.hybrid_kdf_label), provider_->AeadKeyLength(suite_.aead));
}

core::Bundle HybridCryptoHandler::Encrypt(std::span<const uint8_t> plaintext,
                                          const core::KeyMaterial& keys) {
  if (keys.classical.public_key.empty() || keys.pqc.public_key.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kPublicKeyMissing));
  }

  auto classical = provider_->ClassicalEncapsulate(suite_.classical_kem, keys.classical.public_key);
  auto pqc = provider_->PqcEncapsulate(suite_.pqc_kem, keys.pqc.public_key);

  core::Bundle bundle;
  bundle.format_id = core::kHybridFormatId;
  bundle.suite_id = suite_.id;
  bundle.hybrid_salt = crypto::RandomVector(kHybridSaltSize);
  auto symmetric_key = DeriveSymmetricKey(classical.shared_secret, pqc.shared_secret, *bundle.hybrid_salt);

  bundle.nonce = crypto::RandomVector(crypto::kAeadNonceSize);
  bundle.classical_ciphertext = std::move(classical.ciphertext);
  bundle.pqc_ciphertext = std::move(pqc.ciphertext);
  bundle.pbkdf_salt = keys.pbkdf_salt;

  const auto aad = core::BundleAssociatedData(bundle);
  auto sealed = provider_->AeadSeal(suite_.aead, symmetric_key.AsSpan(), bundle.nonce, plaintext, aad);
  bundle.ciphertext = std::move(sealed.ciphertext);
  bundle.tag = std::move(sealed.tag);
  return bundle;
}

std::vector<uint8_t> HybridCryptoHandler::DecryptBundle(const core::Bundle& bundle,
                                                        const core::KeyMaterial& keys) {
  if (keys.classical.secret_key.empty() || keys.pqc.secret_key.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kPrivateKeyMissing));
  }
  auto classical_secret = provider_->ClassicalDecapsulate(suite_.classical_kem, keys.classical.secret_key.AsSpan(),
                                                          bundle.classical_ciphertext);
  auto pqc_secret = provider_->PqcDecapsulate(suite_.pqc_kem, keys.pqc.secret_key.AsSpan(), bundle.pqc_ciphertext);
  auto symmetric_key = DeriveSymmetricKey(classical_secret, pqc_secret, *bundle.hybrid_salt);
  const auto aad = core::BundleAssociatedData(bundle);
  return provider_->AeadOpen(suite_.aead, symmetric_key.AsSpan(), bundle.nonce, bundle.ciphertext,
                             bundle.tag, aad);
}

DecryptAttempt HybridCryptoHandler::Decrypt(std::span<const uint8_t> raw, const KeySource& key_source) {
  return RunDecryptAttempt([&]() {
    const auto bundle = core::ParseBundle(raw);
    if (bundle.format_id != core::kHybridFormatId) {
      return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kFormatIdMismatch));
    }
    if (bundle.suite_id != suite_.id) {
      return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kSuiteIdMismatch));
    }
    if (!bundle.hybrid_salt) {
      return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kHybridSaltMissing));
    }

    if (key_source.is_passphrase()) {
      if (!bundle.pbkdf_salt) {
        return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kPbkdfSaltMissing));
      }
      const auto derived = key_manager_.DerivePassphraseKeys(key_source.passphrase(), *bundle.pbkdf_salt, suite_);
      return DecryptAttempt::Success(DecryptBundle(bundle, derived));
    }
    if (key_source.keys() == nullptr) {
      return DecryptAttempt::Failure(FailureReason::kInvalidKey, std::string(errors::msg::kPassphraseKeysOnly));
    }
    return DecryptAttempt::Success(DecryptBundle(bundle, *key_source.keys()));
  });
}

}  // namespace hv::orchestrator
