#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) &&
           code < ErrorDomainBase(domain) + kErrorDomainSpan;
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kKeyFileOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kKeyFileReadFailed = Make(ErrorDomain::IO, 0x02);
    } // namespace io

    namespace crypto {
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kKnownAnswerFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kRandomFailure = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace validation {
      inline constexpr int kInvalidKey = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kFormatMismatch = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kBundleMalformed = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kSuiteMismatch = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kExportMalformed = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace security {
      inline constexpr int kAuthenticationRejected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kDecryptionExhausted = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kExportNotConfirmed = Make(ErrorDomain::Security, 0x03);
    } // namespace security

    namespace config {
      inline constexpr int kHandlerNotFound = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kActiveSuiteMissing = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kUnknownSuite = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kDuplicateSuite = Make(ErrorDomain::Config, 0x04);
    } // namespace config

    namespace dependency {
      inline constexpr int kAlgorithmUnavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace state {
      inline constexpr int kUnsupportedOperation = Make(ErrorDomain::State, 0x01);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Requested algorithm is not provided by the linked libraries.
  struct AlgorithmUnavailableError : public Error {
    std::string algorithm;
    explicit AlgorithmUnavailableError(std::string alg)
        : Error(ErrorDomain::Dependency, errors::dependency::kAlgorithmUnavailable,
                "Algorithm unavailable: " + alg),
          algorithm(std::move(alg)) {}
  };

  struct InvalidKeyError : public Error {
    explicit InvalidKeyError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kInvalidKey, std::move(msg)) {}
  };

  struct FormatMismatchError : public Error {
    explicit FormatMismatchError(std::string msg,
                                 int c = errors::validation::kFormatMismatch)
        : Error(ErrorDomain::Validation, c, std::move(msg), std::nullopt,
                Retryability::kRetryable) {}
  };

  // Tag or decapsulation failure. Deliberately indistinguishable from a wrong key.
  struct AuthenticationError : public Error {
    explicit AuthenticationError(std::string msg)
        : Error(ErrorDomain::Security, errors::security::kAuthenticationRejected,
                std::move(msg), std::nullopt, Retryability::kRetryable) {}
  };

  struct AggregateDecryptionError : public Error {
    std::vector<std::string> attempted_suites;
    explicit AggregateDecryptionError(std::vector<std::string> attempted)
        : Error(ErrorDomain::Security, errors::security::kDecryptionExhausted,
                "Unable to decrypt data with any configured suite"),
          attempted_suites(std::move(attempted)) {}
  };

  struct ExportConfirmationError : public Error {
    explicit ExportConfirmationError(std::string msg)
        : Error(ErrorDomain::Security, errors::security::kExportNotConfirmed, std::move(msg)) {}
  };

  struct UnsupportedOperationError : public Error {
    explicit UnsupportedOperationError(std::string msg)
        : Error(ErrorDomain::State, errors::state::kUnsupportedOperation, std::move(msg)) {}
  };

  struct HandlerNotFoundError : public Error {
    std::string suite_id;
    explicit HandlerNotFoundError(std::string suite)
        : Error(ErrorDomain::Config, errors::config::kHandlerNotFound,
                "No handler registered for suite: " + suite),
          suite_id(std::move(suite)) {}
  };
} // namespace hv
