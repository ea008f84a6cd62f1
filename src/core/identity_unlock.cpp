#include "sqrl/core/identity_unlock.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "sqrl/common.h"
#include "sqrl/core/rescue_code.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/orchestrator/event_bus.h"
#include "sqrl/security/zeroizer.h"

namespace sqrl::core {

using sqrl::orchestrator::Event;
using sqrl::orchestrator::EventCategory;
using sqrl::orchestrator::EventSeverity;
using sqrl::orchestrator::FieldPrivacy;

namespace {

template <typename T>
std::optional<T> ParseUnsigned(const char* text) {
  const auto length = std::strlen(text);
  T value = 0;
  auto [ptr, ec] = std::from_chars(text, text + length, value, 10);
  if (ec != std::errc() || ptr != text + length) {
    return std::nullopt;
  }
  return value;
}

[[noreturn]] void ThrowRescueCodeRejected() {
  throw sqrl::AuthenticationFailureError(std::string(sqrl::errors::msg::kRescueCodeRejected));
}

std::span<const uint8_t> AsBytes(const std::string& text) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// Derives the sealing key for |rescue_code| without touching the committed
// config and opens |sealed|. Every credential problem surfaces as
// AuthenticationFailureError.
UnlockKey OpenWithRescueCode(std::string_view rescue_code,
                             const ScryptConfig& config,
                             const crypto::SealedSecret& sealed,
                             std::span<const uint8_t> aad,
                             uint8_t effort_seconds) {
  auto digits = TryNormalizeRescueCode(rescue_code);
  if (!digits) {
    ThrowRescueCodeRejected();
  }
  security::Zeroizer::ScopeWiper<char> digits_guard(digits->data(), digits->size());
  if (config.iteration_count == 0) {
    // A protected block always carries its calibrated count.
    ThrowRescueCodeRejected();
  }

  ScryptConfig working = config;
  auto key_bytes = crypto::DeriveKey(AsBytes(*digits), working, effort_seconds);
  security::Zeroizer::ScopeWiper<uint8_t> key_guard(key_bytes.data(), key_bytes.size());
  const crypto::SealingKey key(key_bytes);
  try {
    return crypto::OpenSecret(key, sealed, aad);
  } catch (const sqrl::AuthenticationFailureError&) {
    ThrowRescueCodeRejected();
  }
}

// Runs after the block is committed, so a failure here must not reach the
// caller: the new rescue code would be lost with the exception.
void PublishBlockEvent(const char* event_id, const char* message,
                       const ScryptConfig& config) noexcept {
  try {
    Event event{};
    event.category = EventCategory::kSecurity;
    event.severity = EventSeverity::kInfo;
    event.event_id = event_id;
    event.message = message;
    event.fields.emplace_back("block_type",
                              std::to_string(static_cast<uint16_t>(storage::BlockType::kRescueCode)),
                              FieldPrivacy::kPublic, true);
    event.fields.emplace_back("log_n_factor", std::to_string(config.log_n_factor),
                              FieldPrivacy::kPublic, true);
    event.fields.emplace_back("iterations", std::to_string(config.iteration_count),
                              FieldPrivacy::kPublic, true);
    sqrl::orchestrator::EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"event_publish_error\",\"event_id\":\"" << event_id
              << "\",\"message\":\"" << ex.what() << "\"}" << std::endl;
  }
}

}  // namespace

IdentityUnlockOptions LoadIdentityUnlockOptionsFromEnvironment(IdentityUnlockOptions base) {
  if (const char* env = std::getenv("SQRL_ENSCRYPT_LOG_N"); env && *env != '\0') {
    auto value = ParseUnsigned<unsigned int>(env);
    if (!value || *value < ScryptConfig::kMinLogNFactor || *value > ScryptConfig::kMaxLogNFactor) {
      throw sqrl::Error{sqrl::ErrorDomain::Config, sqrl::errors::config::kInvalidEnScryptParameter,
                        std::string(sqrl::errors::msg::kInvalidEnScryptLogN)};
    }
    base.log_n_factor = static_cast<uint8_t>(*value);
  }
  if (const char* env = std::getenv("SQRL_ENSCRYPT_ITERATIONS"); env && *env != '\0') {
    auto value = ParseUnsigned<uint32_t>(env);
    if (!value || *value == 0) {
      throw sqrl::Error{sqrl::ErrorDomain::Config, sqrl::errors::config::kInvalidEnScryptParameter,
                        std::string(sqrl::errors::msg::kInvalidEnScryptIterations)};
    }
    base.iteration_override = *value;
  }
  return base;
}

IdentityUnlock::IdentityUnlock(ScryptConfig config, uint8_t effort_seconds) noexcept
    : config_(config), effort_seconds_(effort_seconds) {}

IdentityUnlock::Created IdentityUnlock::Create(const UnlockKey& unlock_key,
                                               const IdentityUnlockOptions& options) {
  auto config = ScryptConfig::Generate(options.log_n_factor);
  if (options.iteration_override) {
    if (*options.iteration_override == 0) {
      throw sqrl::Error{sqrl::ErrorDomain::Config, sqrl::errors::config::kInvalidEnScryptParameter,
                        std::string(sqrl::errors::msg::kInvalidEnScryptIterations)};
    }
    config.iteration_count = *options.iteration_override;
  }

  IdentityUnlock block(config, options.effort_seconds);
  auto rotation = block.RotateInternal(std::string_view{}, unlock_key);
  PublishBlockEvent("identity_unlock_created", "Identity unlock key protected", block.config_);
  return Created{std::move(block), std::move(rotation.rescue_code)};
}

IdentityUnlock::Rotation IdentityUnlock::Rotate(std::string_view current_rescue_code,
                                                const UnlockKey& new_unlock_key) {
  auto rotation = RotateInternal(current_rescue_code, new_unlock_key);
  PublishBlockEvent("identity_unlock_rotated", "Identity unlock key rotated", config_);
  return rotation;
}

IdentityUnlock::Rotation IdentityUnlock::RotateInternal(std::string_view current_rescue_code,
                                                        const UnlockKey& new_unlock_key) {
  Rotation result{};
  security::Zeroizer::ScopeWiper<uint8_t> previous_guard(result.previous_unlock_key.data(),
                                                         result.previous_unlock_key.size());
  if (state_ == UnlockState::kProtected) {
    const auto aad = BuildAad(config_);
    result.previous_unlock_key =
        OpenWithRescueCode(current_rescue_code, config_, sealed_,
                           std::span<const uint8_t>(aad.data(), aad.size()), effort_seconds_);
  }

  result.rescue_code = GenerateRescueCode();
  auto digits = NormalizeRescueCode(result.rescue_code);
  security::Zeroizer::ScopeWiper<char> digits_guard(digits.data(), digits.size());

  ScryptConfig staged = config_;
  staged.RefreshSalt();
  auto key_bytes = crypto::DeriveKey(AsBytes(digits), staged, effort_seconds_);
  security::Zeroizer::ScopeWiper<uint8_t> key_guard(key_bytes.data(), key_bytes.size());

  // The AAD covers the staged header, so it is built after derivation settles
  // the iteration count.
  const auto aad = BuildAad(staged);
  auto sealed = crypto::SealSecret(crypto::SealingKey(key_bytes),
                                   std::span<const uint8_t, crypto::kSealedSecretSize>(new_unlock_key),
                                   std::span<const uint8_t>(aad.data(), aad.size()));

  config_ = staged;
  sealed_ = sealed;
  state_ = UnlockState::kProtected;

  previous_guard.Release();
  return result;
}

UnlockKey IdentityUnlock::RecoverUnlockKey(std::string_view rescue_code) const {
  if (state_ != UnlockState::kProtected) {
    throw sqrl::Error{sqrl::ErrorDomain::State, sqrl::errors::state::kUnlockKeyNotProtected,
                      std::string(sqrl::errors::msg::kUnlockKeyNotProtected)};
  }
  const auto aad = BuildAad(config_);
  return OpenWithRescueCode(rescue_code, config_, sealed_,
                            std::span<const uint8_t>(aad.data(), aad.size()), effort_seconds_);
}

IdentityUnlock::Aad IdentityUnlock::BuildAad() const {
  return BuildAad(config_);
}

IdentityUnlock::Aad IdentityUnlock::BuildAad(const ScryptConfig& config) {
  Aad aad{};
  sqrl::StoreLittleEndian16(std::span<uint8_t, 2>(aad.data(), 2), kDeclaredLength);
  sqrl::StoreLittleEndian16(std::span<uint8_t, 2>(aad.data() + 2, 2),
                            static_cast<uint16_t>(storage::BlockType::kRescueCode));
  const auto encoded = config.Encode();
  std::copy(encoded.begin(), encoded.end(), aad.begin() + storage::kRecordHeaderSize);
  return aad;
}

IdentityUnlock IdentityUnlock::DecodeBody(storage::ByteCursor& cursor) {
  auto config = ScryptConfig::Decode(cursor);
  IdentityUnlock block(config);
  block.sealed_.ciphertext = cursor.NextArray<crypto::kSealedSecretSize>();
  block.sealed_.tag = cursor.NextArray<kTagSize>();
  block.state_ = sqrl::IsAllZero(block.sealed_.ciphertext) ? UnlockState::kUninitialized
                                                            : UnlockState::kProtected;
  return block;
}

IdentityUnlock IdentityUnlock::DecodeRecord(storage::ByteCursor& cursor) {
  const auto header = storage::ReadRecordHeader(cursor);
  if (header.length != kDeclaredLength) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kBlockLengthMismatch,
                      std::string(sqrl::errors::msg::kBlockLengthMismatch) + ": " +
                          std::to_string(header.length)};
  }
  if (header.type != static_cast<uint16_t>(storage::BlockType::kRescueCode)) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kBlockTypeMismatch,
                      std::string(sqrl::errors::msg::kBlockTypeMismatch) + ": " +
                          std::to_string(header.type)};
  }
  return DecodeBody(cursor);
}

void IdentityUnlock::EncodeBody(std::vector<uint8_t>& out) const {
  config_.Encode(out);
  out.insert(out.end(), sealed_.ciphertext.begin(), sealed_.ciphertext.end());
  out.insert(out.end(), sealed_.tag.begin(), sealed_.tag.end());
}

bool IdentityUnlock::operator==(const IdentityUnlock& other) const noexcept {
  return config_ == other.config_ && sealed_.ciphertext == other.sealed_.ciphertext &&
         sealed_.tag == other.sealed_.tag && state_ == other.state_;
}

}  // namespace sqrl::core
