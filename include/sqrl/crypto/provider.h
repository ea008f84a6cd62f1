#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "sqrl/crypto/aes_gcm.h"

namespace sqrl::crypto {

struct ScryptParams {
  uint64_t n{0};
  uint64_t r{0};
  uint64_t p{0};
};

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  // Decrypts directly into |destination| and returns the number of bytes written.
  // Throws AuthenticationFailureError on tag mismatch.
  virtual size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) = 0;

  // Fills |out| with scrypt(password, salt, N, r, p).
  virtual void Scrypt(std::span<const uint8_t> password,
                      std::span<const uint8_t> salt,
                      const ScryptParams& params,
                      std::span<uint8_t> out) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) override;

  void Scrypt(std::span<const uint8_t> password,
              std::span<const uint8_t> salt,
              const ScryptParams& params,
              std::span<uint8_t> out) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // libsodium init and AES-GCM self test, once per process
void ResetCryptoProviderForTesting();

}  // namespace sqrl::crypto
