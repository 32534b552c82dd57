#include "hv/orchestrator/crypto_handler.h"

#include <exception>

#include "hv/error.h"

namespace hv::orchestrator {

const char* FailureReasonToString(FailureReason reason) noexcept {
  switch (reason) {
  case FailureReason::kFormatMismatch:
    return "format_mismatch";
  case FailureReason::kAuthentication:
    return "authentication";
  case FailureReason::kInvalidKey:
    return "invalid_key";
  case FailureReason::kUnavailable:
    return "unavailable";
  case FailureReason::kUnsupported:
    return "unsupported";
  case FailureReason::kInternal:
    return "internal";
  }
  return "internal";
}

DecryptAttempt RunDecryptAttempt(const std::function<DecryptAttempt()>& body) noexcept {
  try {
    return body();
  } catch (const AuthenticationError& e) {
    return DecryptAttempt::Failure(FailureReason::kAuthentication, e.what());
  } catch (const FormatMismatchError& e) {
    return DecryptAttempt::Failure(FailureReason::kFormatMismatch, e.what());
  } catch (const InvalidKeyError& e) {
    return DecryptAttempt::Failure(FailureReason::kInvalidKey, e.what());
  } catch (const AlgorithmUnavailableError& e) {
    return DecryptAttempt::Failure(FailureReason::kUnavailable, e.what());
  } catch (const UnsupportedOperationError& e) {
    return DecryptAttempt::Failure(FailureReason::kUnsupported, e.what());
  } catch (const std::exception& e) {
    return DecryptAttempt::Failure(FailureReason::kInternal, e.what());
  }
}

}  // namespace hv::orchestrator
