#include "hv/orchestrator/legacy_handler.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "hv/common.h"
#include "hv/error.h"
#include "hv/errors.h"

namespace hv::orchestrator {

namespace {

constexpr std::string_view kArmorPrefix{"-----BEGIN PGP MESSAGE-----"};
constexpr std::array<uint8_t, 2> kOldFormatPacketPrefix{0x85, 0x02};
constexpr uint8_t kCompressedPacketTag = 0x99;

bool StartsWith(std::span<const uint8_t> raw, std::span<const uint8_t> prefix) noexcept {
  return raw.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), raw.begin());
}

}  // namespace

bool LooksLikeOpenPgp(std::span<const uint8_t> raw) noexcept {
  if (raw.empty()) {
    return false;
  }
  return StartsWith(raw, AsBytes(kArmorPrefix)) || StartsWith(raw, kOldFormatPacketPrefix) ||
         raw.front() == kCompressedPacketTag;
}

core::SuiteDefinition LegacySuiteDefinition() {
  core::SuiteDefinition suite;
  suite.id = kLegacySuiteId;
  suite.description = "Classical-only X25519 + AES-256-GCM (decrypt only)";
  suite.format_id = core::kLegacyFormatId;
  suite.classical_kem = std::string(crypto::alg::kX25519);
  suite.aead = std::string(crypto::alg::kAes256Gcm);
  suite.hybrid_kdf = std::string(crypto::alg::kHkdfSha256);
  suite.hybrid_kdf_label = std::string(kLegacyKdfLabel);
  suite.passphrase_kdf = std::string(crypto::alg::kHkdfSha256);
  return suite;
}

LegacyClassicalHandler::LegacyClassicalHandler(std::shared_ptr<crypto::AlgorithmProvider> provider,
                                               ExternalDecryptor external)
    : suite_(LegacySuiteDefinition()),
      provider_(std::move(provider)),
      key_manager_(provider_),
      external_(std::move(external)) {
  if (!provider_->Supports(crypto::AlgorithmKind::kClassicalKem, suite_.classical_kem)) {
    throw AlgorithmUnavailableError(suite_.classical_kem);
  }
}

bool LegacyClassicalHandler::CanHandle(std::span<const uint8_t> raw) const noexcept {
  if (LooksLikeOpenPgp(raw)) {
    return true;
  }
  auto header = core::PeekBundleHeader(raw);
  return header && header->format_id == core::kLegacyFormatId;
}

core::Bundle LegacyClassicalHandler::Encrypt(std::span<const uint8_t>, const core::KeyMaterial&) {
  throw UnsupportedOperationError(std::string(errors::msg::kLegacyEncryptUnsupported));
}

DecryptAttempt LegacyClassicalHandler::DecryptOpenPgp(std::span<const uint8_t> raw,
                                                      const KeySource& key_source) {
  if (!external_) {
    return DecryptAttempt::Failure(FailureReason::kUnsupported, std::string(errors::msg::kOpenPgpBridgeMissing));
  }
  return RunDecryptAttempt([&]() { return DecryptAttempt::Success(external_(raw, key_source)); });
}

DecryptAttempt LegacyClassicalHandler::Decrypt(std::span<const uint8_t> raw, const KeySource& key_source) {
  if (LooksLikeOpenPgp(raw)) {
    return DecryptOpenPgp(raw, key_source);
  }
  return RunDecryptAttempt([&]() {
    const auto bundle = core::ParseBundle(raw);
    if (bundle.format_id != core::kLegacyFormatId) {
      return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kFormatIdMismatch));
    }
    if (bundle.suite_id != suite_.id) {
      return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kSuiteIdMismatch));
    }

    crypto::KemKeyPair derived;
    const security::SecureBuffer<uint8_t>* secret_key = nullptr;
    if (key_source.is_passphrase()) {
      if (!bundle.pbkdf_salt) {
        return DecryptAttempt::Failure(FailureReason::kFormatMismatch, std::string(errors::msg::kPbkdfSaltMissing));
      }
      derived = key_manager_.DeriveClassicalPassphraseKeys(key_source.passphrase(), *bundle.pbkdf_salt, suite_);
      secret_key = &derived.secret_key;
    } else if (key_source.keys() != nullptr) {
      secret_key = &key_source.keys()->classical.secret_key;
    }
    if (secret_key == nullptr || secret_key->empty()) {
      return DecryptAttempt::Failure(FailureReason::kInvalidKey, std::string(errors::msg::kPrivateKeyMissing));
    }

    auto shared_secret = provider_->ClassicalDecapsulate(suite_.classical_kem, secret_key->AsSpan(),
                                                         bundle.classical_ciphertext);
    std::span<const uint8_t> salt;
    if (bundle.hybrid_salt) {
      salt = *bundle.hybrid_salt;
    }
    auto symmetric_key = provider_->KdfDerive(suite_.hybrid_kdf, shared_secret.AsSpan(), salt,
                                              AsBytes(suite_.hybrid_kdf_label),
                                              provider_->AeadKeyLength(suite_.aead));
    return DecryptAttempt::Success(provider_->AeadOpen(suite_.aead, symmetric_key.AsSpan(), bundle.nonce,
                                                       bundle.ciphertext, bundle.tag));
  });
}

}  // namespace hv::orchestrator
