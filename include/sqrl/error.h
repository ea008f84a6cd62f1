#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sqrl {
  enum class ErrorDomain : std::uint16_t {
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of 0x100 codes so propagated library error
  // numbers never collide with them. Codes inside the span are stable.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace validation {
      inline constexpr int kBlockTruncated = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kBlockLengthMismatch = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kBlockTypeMismatch = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kScryptConfigMalformed = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kRescueCodeMalformed = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace crypto {
      inline constexpr int kScryptFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x04);
      inline constexpr int kBufferTooSmall = Make(ErrorDomain::Crypto, 0x05);
    } // namespace crypto

    namespace config {
      inline constexpr int kInvalidEnScryptParameter = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace state {
      inline constexpr int kUnlockKeyNotProtected = Make(ErrorDomain::State, 0x01);
    } // namespace state

    namespace internal {
      inline constexpr int kSealingKeyConsumed = Make(ErrorDomain::Internal, 0x01);
      inline constexpr int kUnexpectedCiphertextLength = Make(ErrorDomain::Internal, 0x02);
      inline constexpr int kDecryptedSizeMismatch = Make(ErrorDomain::Internal, 0x03);
      inline constexpr int kRecordLengthMismatch = Make(ErrorDomain::Internal, 0x04);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    // Library error number or offending size, when one exists.
    std::optional<int> native_code;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt)
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native) {}
  };

  // Raised when an AEAD tag does not verify. For the rescue block this is the
  // only recoverable failure: the caller may prompt for the rescue code again.
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace sqrl
