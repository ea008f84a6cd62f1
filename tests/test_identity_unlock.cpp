#include "sqrl/core/identity_unlock.h"
#include "sqrl/core/rescue_code.h"
#include "sqrl/crypto/enscrypt.h"
#include "sqrl/crypto/provider.h"
#include "sqrl/error.h"
#include "sqrl/orchestrator/event_bus.h"
#include "sqrl/storage/block.h"

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <vector>

namespace {

constexpr uint32_t kTestIterations = 2;

sqrl::core::IdentityUnlockOptions FastOptions() {
  sqrl::core::IdentityUnlockOptions options{};
  options.log_n_factor = 2;
  options.effort_seconds = 1;
  options.iteration_override = kTestIterations;
  return options;
}

sqrl::core::UnlockKey MakeUnlockKey(uint8_t seed) {
  sqrl::core::UnlockKey key{};
  for (size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>(seed * 31 + i);
  }
  return key;
}

std::vector<uint8_t> EncodeBody(const sqrl::core::IdentityUnlock& block) {
  std::vector<uint8_t> out;
  block.EncodeBody(out);
  return out;
}

sqrl::core::IdentityUnlock DecodeBody(const std::vector<uint8_t>& bytes) {
  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(bytes.data(), bytes.size()));
  return sqrl::core::IdentityUnlock::DecodeBody(cursor);
}

template <typename Fn>
bool ThrowsAuthenticationFailure(Fn&& fn) {
  try {
    fn();
  } catch (const sqrl::AuthenticationFailureError&) {
    return true;
  }
  return false;
}

std::string OtherCode(const std::string& code) {
  std::string other = code;
  other[0] = other[0] == '9' ? '0' : static_cast<char>(other[0] + 1);
  return other;
}

// Fails every AES-GCM seal after the correct rescue code has been accepted.
class FailingSealProvider : public sqrl::crypto::OpenSSLCryptoProvider {
public:
  sqrl::crypto::AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t>, std::span<const uint8_t>,
      std::span<const uint8_t, sqrl::crypto::AES256_GCM::NONCE_SIZE>,
      std::span<const uint8_t, sqrl::crypto::AES256_GCM::KEY_SIZE>) override {
    throw sqrl::Error{sqrl::ErrorDomain::Crypto, sqrl::errors::crypto::kProviderFailure,
                      "injected seal failure"};
  }
};

// Lets the first |allowed| scrypt rounds through, then fails.
class FailingScryptProvider : public sqrl::crypto::OpenSSLCryptoProvider {
public:
  explicit FailingScryptProvider(int allowed) : allowed_(allowed) {}

  void Scrypt(std::span<const uint8_t> password,
              std::span<const uint8_t> salt,
              const sqrl::crypto::ScryptParams& params,
              std::span<uint8_t> out) override {
    if (calls_++ >= allowed_) {
      throw sqrl::Error{sqrl::ErrorDomain::Crypto, sqrl::errors::crypto::kScryptFailed,
                        "injected scrypt failure"};
    }
    OpenSSLCryptoProvider::Scrypt(password, salt, params, out);
  }

private:
  int allowed_;
  int calls_{0};
};

void TestCreateAndRecover() {
  const auto iuk = MakeUnlockKey(1);
  auto created = sqrl::core::IdentityUnlock::Create(iuk, FastOptions());
  const auto& block = created.block;
  assert(block.state() == sqrl::core::UnlockState::kProtected);
  assert(block.scrypt_config().iteration_count == kTestIterations);
  assert(block.scrypt_config().log_n_factor == 2);
  assert(sqrl::core::TryNormalizeRescueCode(created.rescue_code).has_value());
  assert(block.RecoverUnlockKey(created.rescue_code) == iuk && "rescue code must recover the key");

  auto bare = sqrl::core::NormalizeRescueCode(created.rescue_code);
  assert(block.RecoverUnlockKey(bare) == iuk && "undashed code must also recover the key");
}

void TestWrongCodeRejectedWithoutStateChange() {
  const auto iuk = MakeUnlockKey(2);
  auto created = sqrl::core::IdentityUnlock::Create(iuk, FastOptions());
  auto& block = created.block;
  const auto snapshot = block;
  const auto snapshot_bytes = EncodeBody(block);

  const auto wrong = OtherCode(created.rescue_code);
  assert(ThrowsAuthenticationFailure([&] { (void)block.RecoverUnlockKey(wrong); }) &&
         "wrong rescue code must fail authentication");
  assert(ThrowsAuthenticationFailure([&] { (void)block.Rotate(wrong, MakeUnlockKey(3)); }) &&
         "rotation with a wrong code must fail authentication");
  assert(ThrowsAuthenticationFailure([&] { (void)block.Rotate("1234", MakeUnlockKey(3)); }) &&
         "malformed rescue code must fail authentication");
  assert(ThrowsAuthenticationFailure([&] { (void)block.RecoverUnlockKey(""); }));

  assert(block == snapshot && "failed rotation must leave the block untouched");
  assert(EncodeBody(block) == snapshot_bytes);
  assert(block.RecoverUnlockKey(created.rescue_code) == iuk);
}

void TestRotationReturnsPreviousKey() {
  const auto a = MakeUnlockKey(4);
  const auto b = MakeUnlockKey(5);
  auto created = sqrl::core::IdentityUnlock::Create(a, FastOptions());
  auto& block = created.block;
  const auto old_config = block.scrypt_config();

  auto rotation = block.Rotate(created.rescue_code, b);
  assert(rotation.previous_unlock_key == a && "rotation must hand back the previous key");
  assert(rotation.rescue_code != created.rescue_code && "rotation must issue a new code");
  assert(block.scrypt_config().salt != old_config.salt && "rotation must refresh the salt");
  assert(block.scrypt_config().iteration_count == old_config.iteration_count &&
         "calibrated iteration count must be kept");
  assert(block.RecoverUnlockKey(rotation.rescue_code) == b);
  assert(ThrowsAuthenticationFailure([&] { (void)block.RecoverUnlockKey(created.rescue_code); }) &&
         "old rescue code must stop working after rotation");
}

void TestUninitializedSentinel() {
  sqrl::core::IdentityUnlock block(sqrl::core::ScryptConfig::Generate(2), 1);
  assert(block.state() == sqrl::core::UnlockState::kUninitialized);
  for (uint8_t byte : block.encrypted_unlock_key()) {
    assert(byte == 0 && "fresh block must carry the all-zero ciphertext");
  }

  bool threw = false;
  try {
    (void)block.RecoverUnlockKey("0000-0000-0000-0000-0000-0000");
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::State &&
            err.code == sqrl::errors::state::kUnlockKeyNotProtected;
  }
  assert(threw && "nothing to recover before the first rotation");

  auto decoded = DecodeBody(EncodeBody(block));
  assert(decoded.state() == sqrl::core::UnlockState::kUninitialized);

  // Iteration count unset: the first rotation calibrates it.
  const auto iuk = MakeUnlockKey(6);
  auto rotation = block.Rotate("ignored while uninitialized", iuk);
  const sqrl::core::UnlockKey zero{};
  assert(rotation.previous_unlock_key == zero && "first rotation has no previous key");
  assert(block.state() == sqrl::core::UnlockState::kProtected);
  assert(block.scrypt_config().iteration_count >= 1 && "first rotation must calibrate");
  bool all_zero = true;
  for (uint8_t byte : block.encrypted_unlock_key()) {
    all_zero = all_zero && byte == 0;
  }
  assert(!all_zero && "protected block must not carry the sentinel");
  assert(block.RecoverUnlockKey(rotation.rescue_code) == iuk);
}

void TestSerializationIdempotent() {
  auto created = sqrl::core::IdentityUnlock::Create(MakeUnlockKey(7), FastOptions());
  const auto body = EncodeBody(created.block);
  assert(body.size() == sqrl::core::IdentityUnlock::kBodySize && body.size() == 69);

  auto decoded = DecodeBody(body);
  assert(decoded == created.block && "decode(encode(block)) must equal block");
  assert(EncodeBody(decoded) == body);
  assert(decoded.state() == sqrl::core::UnlockState::kProtected);
  assert(decoded.RecoverUnlockKey(created.rescue_code) == MakeUnlockKey(7));

  auto record = sqrl::storage::EncodeRecord(created.block);
  assert(record.size() == 73 && record.size() == created.block.DeclaredLength());
  assert(record[0] == 73 && record[1] == 0 && record[2] == 2 && record[3] == 0);
  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(record.data(), record.size()));
  auto from_record = sqrl::core::IdentityUnlock::DecodeRecord(cursor);
  assert(from_record == created.block);
  assert(cursor.remaining() == 0);
}

void TestRecordFramingRejected() {
  auto created = sqrl::core::IdentityUnlock::Create(MakeUnlockKey(8), FastOptions());
  auto record = sqrl::storage::EncodeRecord(created.block);

  auto wrong_length = record;
  wrong_length[0] = 69;
  bool threw = false;
  try {
    sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(wrong_length.data(), wrong_length.size()));
    (void)sqrl::core::IdentityUnlock::DecodeRecord(cursor);
  } catch (const sqrl::Error& err) {
    threw = err.code == sqrl::errors::validation::kBlockLengthMismatch;
  }
  assert(threw && "foreign declared length must be rejected");

  auto wrong_type = record;
  wrong_type[2] = static_cast<uint8_t>(sqrl::storage::BlockType::kUserAccess);
  threw = false;
  try {
    sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(wrong_type.data(), wrong_type.size()));
    (void)sqrl::core::IdentityUnlock::DecodeRecord(cursor);
  } catch (const sqrl::Error& err) {
    threw = err.code == sqrl::errors::validation::kBlockTypeMismatch;
  }
  assert(threw && "foreign block type must be rejected");
}

void TestTruncatedInput() {
  auto created = sqrl::core::IdentityUnlock::Create(MakeUnlockKey(9), FastOptions());
  const auto body = EncodeBody(created.block);
  for (size_t n = 0; n < body.size(); ++n) {
    std::vector<uint8_t> prefix(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(n));
    bool threw = false;
    try {
      (void)DecodeBody(prefix);
    } catch (const sqrl::Error& err) {
      threw = err.domain == sqrl::ErrorDomain::Validation &&
              err.code == sqrl::errors::validation::kBlockTruncated;
    }
    assert(threw && "every truncated body must raise a truncation error");
  }

  const auto record = sqrl::storage::EncodeRecord(created.block);
  for (size_t n = 0; n < record.size(); ++n) {
    bool threw = false;
    try {
      sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(record.data(), n));
      (void)sqrl::core::IdentityUnlock::DecodeRecord(cursor);
    } catch (const sqrl::Error& err) {
      threw = err.code == sqrl::errors::validation::kBlockTruncated;
    }
    assert(threw && "every truncated record must raise a truncation error");
  }
}

void TestAadLayoutAndBinding() {
  const auto iuk = MakeUnlockKey(10);
  auto created = sqrl::core::IdentityUnlock::Create(iuk, FastOptions());
  const auto& block = created.block;
  const auto aad = block.BuildAad();
  assert(aad.size() == 25);
  assert(aad[0] == 73 && aad[1] == 0 && aad[2] == 2 && aad[3] == 0);
  const auto encoded_config = block.scrypt_config().Encode();
  for (size_t i = 0; i < encoded_config.size(); ++i) {
    assert(aad[4 + i] == encoded_config[i] && "AAD must embed the encoded scrypt config");
  }

  auto digits = sqrl::core::NormalizeRescueCode(created.rescue_code);
  auto config = block.scrypt_config();
  const auto key_bytes = sqrl::crypto::DeriveKey(
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(digits.data()), digits.size()), config, 1);
  const sqrl::crypto::SealingKey key(key_bytes);
  sqrl::crypto::SealedSecret sealed{};
  sealed.ciphertext = block.encrypted_unlock_key();
  sealed.tag = block.verification_tag();

  assert(sqrl::crypto::OpenSecret(key, sealed, std::span<const uint8_t>(aad.data(), aad.size())) == iuk);
  for (size_t i = 0; i < aad.size(); ++i) {
    auto mutated = aad;
    mutated[i] ^= 0x01;
    assert(ThrowsAuthenticationFailure([&] {
             (void)sqrl::crypto::OpenSecret(key, sealed,
                                            std::span<const uint8_t>(mutated.data(), mutated.size()));
           }) &&
           "every AAD byte must be authenticated");
  }

  // A stored salt that was tampered with is caught through the block API too.
  auto body = EncodeBody(block);
  for (size_t i = 0; i < sqrl::core::ScryptConfig::kSaltSize; ++i) {
    auto tampered = body;
    tampered[i] ^= 0x80;
    auto decoded = DecodeBody(tampered);
    assert(ThrowsAuthenticationFailure([&] { (void)decoded.RecoverUnlockKey(created.rescue_code); }) &&
           "tampered salt must fail authentication");
  }

  auto tampered_tag = body;
  tampered_tag.back() ^= 0x01;
  auto decoded = DecodeBody(tampered_tag);
  assert(ThrowsAuthenticationFailure([&] { (void)decoded.RecoverUnlockKey(created.rescue_code); }));
}

void TestRotationFailureAfterAcceptedCodeLeavesBlockUnchanged() {
  const auto iuk = MakeUnlockKey(14);
  auto created = sqrl::core::IdentityUnlock::Create(iuk, FastOptions());
  auto& block = created.block;
  const auto snapshot = block;
  const auto snapshot_bytes = EncodeBody(block);

  sqrl::crypto::SetCryptoProvider(std::make_shared<FailingSealProvider>());
  bool threw = false;
  try {
    (void)block.Rotate(created.rescue_code, MakeUnlockKey(15));
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Crypto;
  }
  sqrl::crypto::ResetCryptoProviderForTesting();
  assert(threw && "a sealing failure must surface to the caller");
  assert(block == snapshot && "a failed seal must leave the block untouched");
  assert(EncodeBody(block) == snapshot_bytes);
  assert(block.RecoverUnlockKey(created.rescue_code) == iuk &&
         "the old rescue code must still recover the key");

  // Recovery of the current key takes kTestIterations rounds; the next round
  // belongs to the derivation under the new rescue code.
  sqrl::crypto::SetCryptoProvider(
      std::make_shared<FailingScryptProvider>(static_cast<int>(kTestIterations)));
  threw = false;
  try {
    (void)block.Rotate(created.rescue_code, MakeUnlockKey(15));
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Crypto &&
            err.code == sqrl::errors::crypto::kScryptFailed;
  }
  sqrl::crypto::ResetCryptoProviderForTesting();
  assert(threw && "a derivation failure must surface to the caller");
  assert(block == snapshot && "a failed derivation must leave the block untouched");
  assert(EncodeBody(block) == snapshot_bytes);
  assert(block.RecoverUnlockKey(created.rescue_code) == iuk);
}

void TestCommittedRotationSurvivesEventFailure() {
  sqrl::orchestrator::ResetEventBusForTesting();
  sqrl::orchestrator::EventBus::Instance().Subscribe([](const sqrl::orchestrator::Event& event) {
    if (event.event_id == "identity_unlock_rotated") {
      throw std::bad_alloc();
    }
  });

  auto created = sqrl::core::IdentityUnlock::Create(MakeUnlockKey(16), FastOptions());
  const auto next = MakeUnlockKey(17);
  sqrl::core::IdentityUnlock::Rotation rotation{};
  bool threw = false;
  try {
    rotation = created.block.Rotate(created.rescue_code, next);
  } catch (const std::exception&) {
    threw = true;
  }
  sqrl::orchestrator::ResetEventBusForTesting();
  assert(!threw && "a committed rotation must hand back its new rescue code");
  assert(created.block.RecoverUnlockKey(rotation.rescue_code) == next);
}

void TestEventsPublishedOnCommit() {
  std::vector<sqrl::orchestrator::Event> events;
  sqrl::orchestrator::EventBus::Instance().Subscribe(
      [&](const sqrl::orchestrator::Event& event) { events.push_back(event); });

  auto created = sqrl::core::IdentityUnlock::Create(MakeUnlockKey(11), FastOptions());
  (void)created.block.Rotate(created.rescue_code, MakeUnlockKey(12));
  const auto count_after_success = events.size();
  assert(ThrowsAuthenticationFailure(
      [&] { (void)created.block.Rotate(created.rescue_code, MakeUnlockKey(13)); }));

  bool saw_created = false;
  bool saw_rotated = false;
  for (const auto& event : events) {
    saw_created = saw_created || event.event_id == "identity_unlock_created";
    saw_rotated = saw_rotated || event.event_id == "identity_unlock_rotated";
    for (const auto& field : event.fields) {
      assert(field.value.find(created.rescue_code) == std::string::npos &&
             "rescue codes must never reach the event stream");
    }
  }
  assert(saw_created && saw_rotated);
  assert(events.size() == count_after_success && "failed rotation must not publish");
  sqrl::orchestrator::ResetEventBusForTesting();
}

void TestOptionsFromEnvironment() {
  ::setenv("SQRL_ENSCRYPT_LOG_N", "4", 1);
  ::setenv("SQRL_ENSCRYPT_ITERATIONS", "3", 1);
  auto options = sqrl::core::LoadIdentityUnlockOptionsFromEnvironment();
  assert(options.log_n_factor == 4);
  assert(options.iteration_override.has_value() && *options.iteration_override == 3);
  assert(options.effort_seconds == sqrl::crypto::kRescueCodeEffortSeconds);

  ::setenv("SQRL_ENSCRYPT_LOG_N", "15", 1);
  bool threw = false;
  try {
    (void)sqrl::core::LoadIdentityUnlockOptionsFromEnvironment();
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Config;
  }
  assert(threw && "out of range log2(N) must be rejected");

  ::unsetenv("SQRL_ENSCRYPT_LOG_N");
  ::setenv("SQRL_ENSCRYPT_ITERATIONS", "0", 1);
  threw = false;
  try {
    (void)sqrl::core::LoadIdentityUnlockOptionsFromEnvironment();
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Config;
  }
  assert(threw && "zero iterations must be rejected");

  ::unsetenv("SQRL_ENSCRYPT_ITERATIONS");
  auto defaults = sqrl::core::LoadIdentityUnlockOptionsFromEnvironment();
  assert(defaults.log_n_factor == sqrl::core::ScryptConfig::kDefaultLogNFactor);
  assert(!defaults.iteration_override.has_value());
}

} // namespace

int main() {
  TestCreateAndRecover();
  TestWrongCodeRejectedWithoutStateChange();
  TestRotationReturnsPreviousKey();
  TestUninitializedSentinel();
  TestSerializationIdempotent();
  TestRecordFramingRejected();
  TestTruncatedInput();
  TestAadLayoutAndBinding();
  TestRotationFailureAfterAcceptedCodeLeavesBlockUnchanged();
  TestCommittedRotationSurvivesEventFailure();
  TestEventsPublishedOnCommit();
  TestOptionsFromEnvironment();
  std::cout << "identity unlock test ok\n";
  return 0;
}
