#include "sqrl/crypto/aes_gcm.h"

#include <algorithm>
#include <string>
#include <utility>

#include "sqrl/crypto/provider.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/security/zeroizer.h"

namespace sqrl::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

std::vector<uint8_t> AES256_GCM_Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  std::vector<uint8_t> plaintext(ciphertext.size());
  size_t decrypted_size = provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key,
                                                      std::span<uint8_t>(plaintext.data(), plaintext.size()));
  plaintext.resize(decrypted_size);
  return plaintext;
}

SealingKey::SealingKey(const std::array<uint8_t, AES256_GCM::KEY_SIZE>& key) noexcept
    : key_(key), valid_(true) {}

SealingKey::~SealingKey() { Clear(); }

SealingKey::SealingKey(SealingKey&& other) noexcept : key_(other.key_), valid_(other.valid_) {
  other.Clear();
}

SealingKey& SealingKey::operator=(SealingKey&& other) noexcept {
  if (this != &other) {
    Clear();
    key_ = other.key_;
    valid_ = other.valid_;
    other.Clear();
  }
  return *this;
}

void SealingKey::Clear() noexcept {
  security::Zeroizer::Wipe(std::span<uint8_t>(key_.data(), key_.size()));
  valid_ = false;
}

SealedSecret SealSecret(SealingKey key,
                        std::span<const uint8_t, kSealedSecretSize> plaintext,
                        std::span<const uint8_t> aad) {
  if (!key.valid()) {
    throw sqrl::Error{sqrl::ErrorDomain::Internal, sqrl::errors::internal::kSealingKeyConsumed,
                      std::string(sqrl::errors::msg::kSealingKeyConsumed)};
  }
  auto provider = GetCryptoProviderShared();
  auto result = provider->EncryptAES256GCM(plaintext, aad,
                                           std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kZeroNonce),
                                           key.bytes());
  if (result.ciphertext.size() != kSealedSecretSize) {
    throw sqrl::Error{sqrl::ErrorDomain::Internal, sqrl::errors::internal::kUnexpectedCiphertextLength,
                      std::string(sqrl::errors::msg::kUnexpectedCiphertextLength),
                      static_cast<int>(result.ciphertext.size())};
  }
  SealedSecret sealed{};
  std::copy(result.ciphertext.begin(), result.ciphertext.end(), sealed.ciphertext.begin());
  sealed.tag = result.tag;
  return sealed;
}

std::array<uint8_t, kSealedSecretSize> OpenSecret(const SealingKey& key,
                                                  const SealedSecret& sealed,
                                                  std::span<const uint8_t> aad) {
  if (!key.valid()) {
    throw sqrl::Error{sqrl::ErrorDomain::Internal, sqrl::errors::internal::kSealingKeyConsumed,
                      std::string(sqrl::errors::msg::kSealingKeyConsumed)};
  }
  auto provider = GetCryptoProviderShared();
  std::array<uint8_t, kSealedSecretSize> plaintext{};
  security::Zeroizer::ScopeWiper<uint8_t> guard(plaintext.data(), plaintext.size());
  const size_t written = provider->DecryptAES256GCM(
      std::span<const uint8_t>(sealed.ciphertext.data(), sealed.ciphertext.size()), aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kZeroNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(sealed.tag), key.bytes(),
      std::span<uint8_t>(plaintext.data(), plaintext.size()));
  if (written != plaintext.size()) {
    throw sqrl::Error{sqrl::ErrorDomain::Internal, sqrl::errors::internal::kDecryptedSizeMismatch,
                      std::string(sqrl::errors::msg::kDecryptedSizeMismatch),
                      static_cast<int>(written)};
  }
  guard.Release();
  return plaintext;
}

} // namespace sqrl::crypto
