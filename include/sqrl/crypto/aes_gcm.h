#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sqrl::crypto {

struct AES256_GCM {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;

  struct EncryptionResult {
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, TAG_SIZE> tag;
  };
};

// Encrypts |plaintext| using AES-256-GCM. Throws sqrl::Error on provider failures.
AES256_GCM::EncryptionResult AES256_GCM_Encrypt(std::span<const uint8_t> plaintext,
                                               std::span<const uint8_t> aad,
                                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// Decrypts |ciphertext| and validates |tag|. Throws AuthenticationFailureError on
// tag mismatch and sqrl::Error on other provider failures.
std::vector<uint8_t> AES256_GCM_Decrypt(std::span<const uint8_t> ciphertext,
                                        std::span<const uint8_t> aad,
                                        std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                        std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
                                        std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// The sealed-secret helpers below always run GCM with this all-zero nonce.
// That is only sound while every SealingKey encrypts exactly one plaintext.
inline constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kZeroNonce{};

inline constexpr size_t kSealedSecretSize = 32;

// Key material derived for a single seal. Move-only; the bytes are wiped on
// destruction and when moved from. SealSecret() takes the key by value, so a
// key that sealed once can not seal again.
class SealingKey {
public:
  explicit SealingKey(const std::array<uint8_t, AES256_GCM::KEY_SIZE>& key) noexcept;
  ~SealingKey();

  SealingKey(const SealingKey&) = delete;
  SealingKey& operator=(const SealingKey&) = delete;
  SealingKey(SealingKey&& other) noexcept;
  SealingKey& operator=(SealingKey&& other) noexcept;

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::span<const uint8_t, AES256_GCM::KEY_SIZE> bytes() const noexcept {
    return std::span<const uint8_t, AES256_GCM::KEY_SIZE>(key_);
  }

private:
  void Clear() noexcept;

  std::array<uint8_t, AES256_GCM::KEY_SIZE> key_{};
  bool valid_{false};
};

struct SealedSecret {
  std::array<uint8_t, kSealedSecretSize> ciphertext{};
  std::array<uint8_t, AES256_GCM::TAG_SIZE> tag{};
};

// Encrypts a 32-byte secret under |key| with the zero nonce and consumes the key.
SealedSecret SealSecret(SealingKey key,
                        std::span<const uint8_t, kSealedSecretSize> plaintext,
                        std::span<const uint8_t> aad);

// Verifies |sealed| against |aad| and returns the plaintext. Throws
// AuthenticationFailureError when the tag does not verify.
std::array<uint8_t, kSealedSecretSize> OpenSecret(const SealingKey& key,
                                                  const SealedSecret& sealed,
                                                  std::span<const uint8_t> aad);

} // namespace sqrl::crypto
