#include "sqrl/core/scrypt_config.h"

#include <algorithm>
#include <span>
#include <string>

#include "sqrl/common.h"
#include "sqrl/crypto/random.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/storage/block.h"

namespace sqrl::core {

namespace {

void ValidateLogNFactor(uint8_t log_n_factor) {
  if (log_n_factor < ScryptConfig::kMinLogNFactor || log_n_factor > ScryptConfig::kMaxLogNFactor) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kScryptConfigMalformed,
                      std::string(sqrl::errors::msg::kScryptLogNOutOfRange) + ": " +
                          std::to_string(log_n_factor)};
  }
}

}  // namespace

ScryptConfig ScryptConfig::Generate(uint8_t log_n_factor) {
  ValidateLogNFactor(log_n_factor);
  ScryptConfig config{};
  config.log_n_factor = log_n_factor;
  config.iteration_count = 0;
  config.RefreshSalt();
  return config;
}

void ScryptConfig::RefreshSalt() {
  crypto::SystemRandomBytes(std::span<uint8_t>(salt.data(), salt.size()));
}

std::array<uint8_t, ScryptConfig::kEncodedSize> ScryptConfig::Encode() const {
  std::array<uint8_t, kEncodedSize> out{};
  std::copy(salt.begin(), salt.end(), out.begin());
  out[kSaltSize] = log_n_factor;
  sqrl::StoreLittleEndian32(std::span<uint8_t, 4>(out.data() + kSaltSize + 1, 4), iteration_count);
  return out;
}

void ScryptConfig::Encode(std::vector<uint8_t>& out) const {
  auto encoded = Encode();
  out.insert(out.end(), encoded.begin(), encoded.end());
}

ScryptConfig ScryptConfig::Decode(storage::ByteCursor& cursor) {
  ScryptConfig config{};
  config.salt = cursor.NextArray<kSaltSize>();
  config.log_n_factor = cursor.NextU8();
  config.iteration_count = cursor.NextU32();
  ValidateLogNFactor(config.log_n_factor);
  return config;
}

}  // namespace sqrl::core
