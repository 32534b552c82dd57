#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hv/core/bundle.h"
#include "hv/core/key_material.h"
#include "hv/security/secure_buffer.h"

namespace hv::orchestrator {

enum class FailureReason {
  kFormatMismatch,
  kAuthentication,
  kInvalidKey,
  kUnavailable,
  kUnsupported,
  kInternal,
};

const char* FailureReasonToString(FailureReason reason) noexcept;

// Outcome of one handler's decryption attempt. Failures are values so the
// orchestrator can move on to the next suite.
class DecryptAttempt {
 public:
  static DecryptAttempt Success(std::vector<uint8_t> plaintext) {
    DecryptAttempt attempt;
    attempt.succeeded_ = true;
    attempt.plaintext_ = std::move(plaintext);
    return attempt;
  }

  static DecryptAttempt Failure(FailureReason reason, std::string message) {
    DecryptAttempt attempt;
    attempt.reason_ = reason;
    attempt.message_ = std::move(message);
    return attempt;
  }

  bool succeeded() const noexcept { return succeeded_; }
  FailureReason reason() const noexcept { return reason_; }
  const std::string& message() const noexcept { return message_; }
  const std::vector<uint8_t>& plaintext() const noexcept { return plaintext_; }
  std::vector<uint8_t> TakePlaintext() noexcept { return std::move(plaintext_); }

 private:
  DecryptAttempt() = default;

  bool succeeded_{false};
  FailureReason reason_{FailureReason::kInternal};
  std::string message_;
  std::vector<uint8_t> plaintext_;
};

// Either caller-held key material or a passphrase from which each handler
// derives keys with the salt embedded in the bundle.
class KeySource {
 public:
  // |keys| must outlive the KeySource.
  static KeySource FromKeys(const core::KeyMaterial& keys) {
    KeySource source;
    source.keys_ = &keys;
    return source;
  }

  static KeySource FromPassphrase(std::string_view passphrase) {
    KeySource source;
    source.passphrase_ = security::SecureBuffer<char>(std::span<const char>(passphrase.data(), passphrase.size()));
    source.has_passphrase_ = true;
    return source;
  }

  bool is_passphrase() const noexcept { return has_passphrase_; }
  const core::KeyMaterial* keys() const noexcept { return keys_; }
  std::string_view passphrase() const noexcept {
    return std::string_view(passphrase_.data(), passphrase_.size());
  }

 private:
  KeySource() = default;

  const core::KeyMaterial* keys_{nullptr};
  security::SecureBuffer<char> passphrase_;
  bool has_passphrase_{false};
};

// Runs |body| and converts the library's exception types into Failure values.
DecryptAttempt RunDecryptAttempt(const std::function<DecryptAttempt()>& body) noexcept;

class CryptoHandler {
 public:
  virtual ~CryptoHandler() = default;

  virtual const std::string& SuiteId() const noexcept = 0;

  // Cheap recognition from the header only; never decrypts.
  virtual bool CanHandle(std::span<const uint8_t> raw) const noexcept = 0;

  virtual core::Bundle Encrypt(std::span<const uint8_t> plaintext, const core::KeyMaterial& keys) = 0;

  // Never throws for bad input or wrong keys; those come back as Failure.
  virtual DecryptAttempt Decrypt(std::span<const uint8_t> raw, const KeySource& key_source) = 0;
};

}  // namespace hv::orchestrator
