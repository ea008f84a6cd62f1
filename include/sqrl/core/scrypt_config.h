#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sqrl::storage {
class ByteCursor;
}

namespace sqrl::core {

// Cost parameters for one EnScrypt derivation as stored in identity blocks.
// Wire layout (21 bytes): salt[16] | log_n_factor u8 | iteration_count u32 LE.
struct ScryptConfig {
  static constexpr std::size_t kSaltSize = 16;
  static constexpr std::size_t kEncodedSize = kSaltSize + sizeof(uint8_t) + sizeof(uint32_t);
  static constexpr uint8_t kDefaultLogNFactor = 9;
  static constexpr uint8_t kMinLogNFactor = 1;
  static constexpr uint8_t kMaxLogNFactor = 14;

  std::array<uint8_t, kSaltSize> salt{};
  uint8_t log_n_factor{kDefaultLogNFactor};
  uint32_t iteration_count{0}; // 0 until the first derivation calibrates it

  // Fresh random salt, uncalibrated. Throws sqrl::Error{Validation} when
  // |log_n_factor| is outside [kMinLogNFactor, kMaxLogNFactor].
  static ScryptConfig Generate(uint8_t log_n_factor = kDefaultLogNFactor);

  void RefreshSalt();

  void Encode(std::vector<uint8_t>& out) const;
  [[nodiscard]] std::array<uint8_t, kEncodedSize> Encode() const;
  static ScryptConfig Decode(storage::ByteCursor& cursor);

  bool operator==(const ScryptConfig&) const = default;
};

static_assert(ScryptConfig::kEncodedSize == 21, "scrypt config wire size is part of the block format");

}  // namespace sqrl::core
