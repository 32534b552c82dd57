#pragma once

#include <string_view>

namespace hv::errors::msg {
// Centralized message catalog. None of these may carry secret material.
inline constexpr std::string_view kAuthenticationFailed{"Authentication failed"};
inline constexpr std::string_view kDecapsulationFailed{"Key decapsulation failed"};
inline constexpr std::string_view kBundleMagicMismatch{"Bundle magic mismatch"};
inline constexpr std::string_view kBundleVersionUnsupported{"Unsupported bundle version"};
inline constexpr std::string_view kBundleTruncated{"Bundle truncated"};
inline constexpr std::string_view kBundleRecordOrder{"Bundle records out of order"};
inline constexpr std::string_view kBundleRecordUnknown{"Unknown bundle record"};
inline constexpr std::string_view kBundleRecordTooLarge{"Bundle record exceeds size limit"};
inline constexpr std::string_view kBundleRequiredMissing{"Required bundle record missing"};
inline constexpr std::string_view kBundleTrailingBytes{"Unexpected trailing bytes in bundle"};
inline constexpr std::string_view kFormatIdMismatch{"Bundle format identifier does not match handler"};
inline constexpr std::string_view kSuiteIdMismatch{"Bundle suite id does not match handler"};
inline constexpr std::string_view kHybridSaltMissing{"Bundle lacks hybrid KDF salt"};
inline constexpr std::string_view kPbkdfSaltMissing{"Bundle lacks passphrase salt"};
inline constexpr std::string_view kUnsupportedArgon2Parameters{"Unsupported Argon2 parameters"};
inline constexpr std::string_view kArgon2DerivationFailed{"Argon2id derivation failed"};
inline constexpr std::string_view kPbkdf2DerivationFailed{"PBKDF2 derivation failed"};
inline constexpr std::string_view kKeyFileTooLarge{"Key file exceeds maximum supported size"};
inline constexpr std::string_view kPrivateKeyMissing{"Private key material missing"};
inline constexpr std::string_view kPublicKeyMissing{"Public key material missing"};
inline constexpr std::string_view kExportNotConfirmed{"Private key export requires explicit double confirmation"};
inline constexpr std::string_view kExportPassphraseEmpty{"Export passphrase must not be empty"};
inline constexpr std::string_view kExportContainerMalformed{"Exported key container malformed"};
inline constexpr std::string_view kLegacyEncryptUnsupported{"Legacy handler is decrypt-only"};
inline constexpr std::string_view kOpenPgpBridgeMissing{"No external decryptor configured for OpenPGP data"};
inline constexpr std::string_view kActiveSuiteMissing{"No active encryption suite configured"};
inline constexpr std::string_view kPassphraseKeysOnly{"Key source carries no usable key material"};
}  // namespace hv::errors::msg
