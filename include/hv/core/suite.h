#pragma once

#include <string>

#include "hv/crypto/types.h"

namespace hv::core {

// Static description of one cryptographic suite. Loaded once at startup and
// never mutated.
struct SuiteDefinition {
  std::string id;
  std::string description;
  std::string format_id;
  std::string classical_kem;
  std::string pqc_kem;
  std::string aead;
  std::string hybrid_kdf;
  std::string hybrid_kdf_label;
  crypto::PbkdfParams pbkdf;
  std::string passphrase_kdf;
};

inline constexpr const char* kHybridFormatId = "HV_HYBRID_V1";
inline constexpr const char* kLegacyFormatId = "HV_CLASSICAL_V1";

}  // namespace hv::core
