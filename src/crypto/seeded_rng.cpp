#include "hv/crypto/seeded_rng.h"

#include <algorithm>
#include <mutex>
#include <string_view>
#include <vector>

#include <oqs/oqs.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "hv/error.h"
#include "hv/security/zeroizer.h"

namespace hv::crypto {

namespace {

constexpr std::string_view kStreamDomain{"hv-seeded-oqs-stream/v1"};

thread_local bool g_randomness_failed = false;

bool Sha3_512(std::span<const uint8_t> data, std::span<uint8_t, 64> out) noexcept {
  unsigned int len = 0;
  return EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha3_512(), nullptr) == 1 &&
         len == out.size();
}

void OqsRandombytesShim(uint8_t* out, size_t outlen) {
  if (out == nullptr || outlen == 0) {
    return;
  }
  if (auto* stream = SeededOqsRandomness::Current()) {
    stream->Generate(out, outlen);
    return;
  }
  // Exceptions may not cross the C boundary; failure is surfaced by the caller.
  if (RAND_bytes(out, static_cast<int>(outlen)) != 1) {
    g_randomness_failed = true;
  }
}

}  // namespace

SeededOqsRandomness::SeededOqsRandomness(std::span<const uint8_t> seed)
    : previous_(Instance()) {
  std::vector<uint8_t> material(kStreamDomain.begin(), kStreamDomain.end());
  material.insert(material.end(), seed.begin(), seed.end());
  security::Zeroizer::ScopeWiper<uint8_t> material_guard(material.data(), material.size());
  if (!Sha3_512(material, key_)) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure,
                "EVP_Digest(EVP_sha3_512) failed");
  }
  Refill();
  Instance() = this;
}

SeededOqsRandomness::~SeededOqsRandomness() {
  Instance() = previous_;
  security::Zeroizer::Wipe(key_);
  security::Zeroizer::Wipe(block_);
  counter_ = 0;
}

SeededOqsRandomness* SeededOqsRandomness::Current() noexcept { return Instance(); }

SeededOqsRandomness*& SeededOqsRandomness::Instance() noexcept {
  thread_local SeededOqsRandomness* instance = nullptr;
  return instance;
}

void SeededOqsRandomness::Generate(uint8_t* out, size_t len) noexcept {
  while (len > 0) {
    if (block_index_ == block_.size()) {
      Refill();
    }
    const size_t take = std::min(len, block_.size() - block_index_);
    std::copy_n(block_.begin() + static_cast<std::ptrdiff_t>(block_index_), take, out);
    block_index_ += take;
    out += take;
    len -= take;
  }
}

void SeededOqsRandomness::Refill() noexcept {
  std::array<uint8_t, 72> input{};
  std::copy(key_.begin(), key_.end(), input.begin());
  for (size_t i = 0; i < sizeof(counter_); ++i) {
    input[key_.size() + i] = static_cast<uint8_t>((counter_ >> (8U * i)) & 0xFFU);
  }
  ++counter_;
  if (!Sha3_512(input, block_)) {
    g_randomness_failed = true;
  }
  security::Zeroizer::Wipe(input);
  block_index_ = 0;
}

void InstallOqsRandomnessHook() {
  static std::once_flag once;
  std::call_once(once, []() { OQS_randombytes_custom_algorithm(&OqsRandombytesShim); });
}

bool ConsumeOqsRandomnessFailure() noexcept {
  const bool failed = g_randomness_failed;
  g_randomness_failed = false;
  return failed;
}

}  // namespace hv::crypto
