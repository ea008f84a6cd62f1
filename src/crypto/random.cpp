#include "sqrl/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include <sodium.h>

#include "sqrl/crypto/provider.h"
#include "sqrl/error.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw sqrl::Error(sqrl::ErrorDomain::Crypto, sqrl::errors::crypto::kRandomUnavailable,
                      "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw sqrl::Error(sqrl::ErrorDomain::Crypto, sqrl::errors::crypto::kRandomUnavailable,
                      "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace sqrl::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // kernel without getrandom, fall back to /dev/urandom below
      }
      throw sqrl::Error(sqrl::ErrorDomain::Crypto, sqrl::errors::crypto::kRandomUnavailable,
                        "getrandom failed", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

uint32_t RandomUniform(uint32_t upper_bound) {
  EnsureCryptoProviderInitialized(); // sodium_init before randombytes_*
  return ::randombytes_uniform(upper_bound);
}

}  // namespace sqrl::crypto
