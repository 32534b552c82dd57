#include "hv/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>

#if defined(__linux__)
#include <sys/random.h>
#endif

#include "hv/error.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw hv::Error(hv::ErrorDomain::Crypto, hv::errors::crypto::kRandomFailure,
                    "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw hv::Error(hv::ErrorDomain::Crypto, hv::errors::crypto::kRandomFailure,
                    "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace hv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__linux__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // kernel predates getrandom
      }
      throw Error(ErrorDomain::Crypto, errors::crypto::kRandomFailure, "getrandom failed",
                  errno);
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace hv::crypto
