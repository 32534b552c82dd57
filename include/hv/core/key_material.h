#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hv/crypto/types.h"

namespace hv::core {

// Keys for one suite. Private halves live in SecureBuffer and are wiped when
// the value is destroyed. Move-only.
struct KeyMaterial {
  std::string suite_id;
  crypto::KemKeyPair classical;
  crypto::KemKeyPair pqc;
  std::optional<std::vector<uint8_t>> pbkdf_salt;
};

}  // namespace hv::core
