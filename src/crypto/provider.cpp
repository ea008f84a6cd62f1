#include "sqrl/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <sodium.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "sqrl/crypto/ct.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/orchestrator/event_bus.h"

namespace sqrl::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = sqrl::errors::crypto::kProviderFailure,
                                   std::optional<int> native = std::nullopt) {
  throw sqrl::Error(sqrl::ErrorDomain::Crypto, code, message, native);
}

// NIST GCM test case 16 (AES-256, 96-bit IV, 20 bytes of AAD).
void RunAESGCMKnownAnswerTest() {
  static constexpr std::array<uint8_t, AES256_GCM::KEY_SIZE> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce,
      0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x52, 0x2d, 0xc1, 0xf0, 0x99, 0x56, 0x7d, 0x07, 0xf4, 0x7f, 0x37, 0xa3,
      0x2a, 0x84, 0x42, 0x7d, 0x64, 0x3a, 0x8c, 0xdc, 0xbf, 0xe5, 0xc0, 0xc9,
      0x75, 0x98, 0xa2, 0xbd, 0x25, 0x55, 0xd1, 0xaa, 0x8c, 0xb0, 0x8e, 0x48,
      0x59, 0x0d, 0xbb, 0x3d, 0xa7, 0xb0, 0x8b, 0x10, 0x56, 0x82, 0x88, 0x38,
      0xc5, 0xf6, 0x1e, 0x63, 0x93, 0xba, 0x7a, 0x0a, 0xbc, 0xc9, 0xf6, 0x62};
  static constexpr std::array<uint8_t, AES256_GCM::TAG_SIZE> kExpectedTag{
      0x76, 0xfc, 0x6e, 0xce, 0x0f, 0x4e, 0x17, 0x68,
      0xcd, 0xdf, 0x88, 0x53, 0xbb, 0x2d, 0x55, 0x1b};

  OpenSSLCryptoProvider provider;
  const auto enc = provider.EncryptAES256GCM(
      std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  std::array<uint8_t, kExpectedCiphertext.size()> cipher_buf{};
  const size_t cipher_copy = std::min(enc.ciphertext.size(), cipher_buf.size());
  std::copy_n(enc.ciphertext.begin(), cipher_copy, cipher_buf.begin());
  uint32_t cipher_mask = 0;
  cipher_mask |= enc.ciphertext.size() == kExpectedCiphertext.size() ? 0u : 1u;
  cipher_mask |= sqrl::crypto::ct::CompareEqual(cipher_buf, kExpectedCiphertext) ? 0u : 2u;
  if (cipher_mask != 0u) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch", sqrl::errors::crypto::kSelfTestFailed);
  }
  if (!sqrl::crypto::ct::CompareEqual(enc.tag, kExpectedTag)) {
    ThrowCryptoError("AES-GCM KAT tag mismatch", sqrl::errors::crypto::kSelfTestFailed);
  }

  std::array<uint8_t, kPlaintext.size()> plain_buf{};
  const size_t written = provider.DecryptAES256GCM(
      std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(enc.tag),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey),
      std::span<uint8_t>(plain_buf.data(), plain_buf.size()));
  uint32_t plain_mask = 0;
  plain_mask |= written == kPlaintext.size() ? 0u : 1u;
  plain_mask |= sqrl::crypto::ct::CompareEqual(plain_buf, kPlaintext) ? 0u : 2u;
  if (plain_mask != 0u) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch", sqrl::errors::crypto::kSelfTestFailed);
  }
}

bool EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  bool ran_now = false;
  std::call_once(state.once, [&state, &ran_now]() {
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
    RunAESGCMKnownAnswerTest();
    state.kat_passed = true;
    ran_now = true;
  });
  return ran_now;
}

void PublishSelfTestPassed() {
  sqrl::orchestrator::Event event{};
  event.category = sqrl::orchestrator::EventCategory::kDiagnostics;
  event.severity = sqrl::orchestrator::EventSeverity::kDebug;
  event.event_id = "crypto_self_test_passed";
  event.message = "AES-GCM known-answer test passed";
  event.fields.emplace_back("openssl", OpenSSL_version(OPENSSL_VERSION));
  event.fields.emplace_back("sodium", sodium_version_string());
  sqrl::orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  if (EnsureCryptoRuntimeConfigured()) {
    PublishSelfTestPassed();
  }
}

AES256_GCM::EncryptionResult OpenSSLCryptoProvider::EncryptAES256GCM(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AES256_GCM::EncryptionResult result;
  result.ciphertext.resize(plaintext.size());
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(),
                          result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           AES256_GCM::TAG_SIZE, result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
  }

  return result;
}

size_t OpenSSLCryptoProvider::DecryptAES256GCM(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  if (destination.size() < ciphertext.size()) {
    ThrowCryptoError("AES-GCM destination buffer too small", sqrl::errors::crypto::kBufferTooSmall,
                     static_cast<int>(destination.size()));
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), destination.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           AES256_GCM::TAG_SIZE, const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
  }

  int final_len = 0;
  int ret = EVP_DecryptFinal_ex(ctx.get(), destination.data() + total, &final_len);
  if (ret <= 0) {
    // Unverified plaintext never leaves this function.
    sodium_memzero(destination.data(), destination.size());
    throw sqrl::AuthenticationFailureError(
        BuildOpenSSLErrorMessage("EVP_DecryptFinal_ex (authentication failed)"));
  }
  total += final_len;

  return static_cast<size_t>(total);
}

void OpenSSLCryptoProvider::Scrypt(std::span<const uint8_t> password,
                                   std::span<const uint8_t> salt,
                                   const ScryptParams& params,
                                   std::span<uint8_t> out) {
  // 128 * r * N bytes for the V array plus 128 * r * p for B, with headroom.
  const uint64_t max_mem = 128u * params.r * (params.n + params.p) + (1u << 20);
  if (EVP_PBE_scrypt(reinterpret_cast<const char*>(password.data()), password.size(),
                     salt.data(), salt.size(), params.n, params.r, params.p, max_mem,
                     out.data(), out.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage(std::string(sqrl::errors::msg::kScryptDerivationFailed).c_str()),
                     sqrl::errors::crypto::kScryptFailed);
  }
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", sqrl::errors::crypto::kProviderFailure,
                     static_cast<int>(len));
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoProviderInitialized();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace sqrl::crypto
