#pragma once

// Identity Unlock Key rescue block (SQRL storage block type 2).

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sqrl/core/scrypt_config.h"
#include "sqrl/crypto/aes_gcm.h"
#include "sqrl/crypto/enscrypt.h"
#include "sqrl/storage/block.h"

namespace sqrl::core {

using UnlockKey = std::array<uint8_t, crypto::kSealedSecretSize>;

enum class UnlockState : uint8_t {
  kUninitialized,
  kProtected
};

struct IdentityUnlockOptions {
  uint8_t log_n_factor{ScryptConfig::kDefaultLogNFactor};
  uint8_t effort_seconds{crypto::kRescueCodeEffortSeconds};
  std::optional<uint32_t> iteration_override{};
};

// Applies SQRL_ENSCRYPT_LOG_N and SQRL_ENSCRYPT_ITERATIONS on top of |base|.
// Throws sqrl::Error{Config} when a variable is set but not a valid value.
IdentityUnlockOptions LoadIdentityUnlockOptionsFromEnvironment(IdentityUnlockOptions base = {});

class IdentityUnlock final : public storage::DataBlock {
public:
  static constexpr std::size_t kTagSize = crypto::AES256_GCM::TAG_SIZE;
  static constexpr std::size_t kBodySize =
      ScryptConfig::kEncodedSize + crypto::kSealedSecretSize + kTagSize;
  static constexpr uint16_t kDeclaredLength =
      static_cast<uint16_t>(storage::kRecordHeaderSize + kBodySize);
  static constexpr std::size_t kAadSize = storage::kRecordHeaderSize + ScryptConfig::kEncodedSize;

  using Aad = std::array<uint8_t, kAadSize>;

  struct Created;

  struct Rotation {
    std::string rescue_code;
    UnlockKey previous_unlock_key{}; // all-zero when nothing was protected before
  };

  // Uninitialized block owning |config|; nothing is protected until Rotate().
  explicit IdentityUnlock(ScryptConfig config,
                          uint8_t effort_seconds = crypto::kRescueCodeEffortSeconds) noexcept;

  // Builds a fresh block and protects |unlock_key| under a new rescue code.
  static Created Create(const UnlockKey& unlock_key, const IdentityUnlockOptions& options = {});

  // Recovers the protected key with |current_rescue_code| (ignored while
  // uninitialized), then protects |new_unlock_key| under a new rescue code
  // and a new salt. A wrong or malformed code throws
  // AuthenticationFailureError and leaves the block untouched.
  Rotation Rotate(std::string_view current_rescue_code, const UnlockKey& new_unlock_key);

  // Returns the protected key without rotating. Throws
  // AuthenticationFailureError on a wrong code and sqrl::Error{State} when
  // nothing is protected.
  [[nodiscard]] UnlockKey RecoverUnlockKey(std::string_view rescue_code) const;

  // u16 LE declared length | u16 LE block type | encoded scrypt config.
  [[nodiscard]] Aad BuildAad() const;

  static IdentityUnlock DecodeBody(storage::ByteCursor& cursor);
  // Reads the record framing, rejects a foreign length or type, then decodes the body.
  static IdentityUnlock DecodeRecord(storage::ByteCursor& cursor);

  [[nodiscard]] storage::BlockType Type() const noexcept override { return storage::BlockType::kRescueCode; }
  [[nodiscard]] uint16_t DeclaredLength() const noexcept override { return kDeclaredLength; }
  void EncodeBody(std::vector<uint8_t>& out) const override;

  [[nodiscard]] const ScryptConfig& scrypt_config() const noexcept { return config_; }
  [[nodiscard]] const std::array<uint8_t, crypto::kSealedSecretSize>& encrypted_unlock_key() const noexcept {
    return sealed_.ciphertext;
  }
  [[nodiscard]] const std::array<uint8_t, kTagSize>& verification_tag() const noexcept { return sealed_.tag; }
  [[nodiscard]] UnlockState state() const noexcept { return state_; }

  bool operator==(const IdentityUnlock& other) const noexcept;

private:
  static Aad BuildAad(const ScryptConfig& config);
  Rotation RotateInternal(std::string_view current_rescue_code, const UnlockKey& new_unlock_key);

  ScryptConfig config_;
  crypto::SealedSecret sealed_{};
  UnlockState state_{UnlockState::kUninitialized};
  uint8_t effort_seconds_{crypto::kRescueCodeEffortSeconds};
};

struct IdentityUnlock::Created {
  IdentityUnlock block;
  std::string rescue_code;
};

static_assert(IdentityUnlock::kBodySize == 69, "identity unlock body layout changed");
static_assert(IdentityUnlock::kDeclaredLength == 73, "identity unlock declared length changed");
static_assert(IdentityUnlock::kAadSize == 25, "identity unlock AAD layout changed");

}  // namespace sqrl::core
