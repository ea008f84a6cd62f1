#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <span>

#include "sqrl/core/scrypt_config.h"

namespace sqrl::crypto {

// EnScrypt chains scrypt(N = 2^log_n_factor, r = 256, p = 1, dkLen = 32) runs:
// the first run is salted with the caller's salt, every later run with the
// previous output, and the key is the XOR of all outputs.
inline constexpr uint64_t kEnScryptBlockSize = 256;
inline constexpr uint64_t kEnScryptParallelism = 1;
inline constexpr std::size_t kEnScryptKeySize = 32;

std::array<uint8_t, kEnScryptKeySize> EnScrypt(std::span<const uint8_t> password,
                                                std::span<const uint8_t> salt,
                                                uint8_t log_n_factor,
                                                uint32_t iterations);

struct EnScryptCalibration {
  std::array<uint8_t, kEnScryptKeySize> key{};
  uint32_t iterations{0};
};

// Runs iterations until |duration| has elapsed (at least one) and reports how
// many were needed so the same key can be re-derived with EnScrypt().
EnScryptCalibration EnScryptForDuration(std::span<const uint8_t> password,
                                        std::span<const uint8_t> salt,
                                        uint8_t log_n_factor,
                                        std::chrono::milliseconds duration);

// Seconds of EnScrypt work spent when protecting the identity unlock key.
inline constexpr uint8_t kRescueCodeEffortSeconds = 7;

// Derives a 32-byte key with |config|'s salt and cost. A zero iteration count
// is calibrated against |effort_seconds| and written back into |config|; any
// other count runs exactly that many iterations.
std::array<uint8_t, kEnScryptKeySize> DeriveKey(std::span<const uint8_t> password,
                                                 core::ScryptConfig& config,
                                                 uint8_t effort_seconds);

}  // namespace sqrl::crypto
