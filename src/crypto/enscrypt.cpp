#include "sqrl/crypto/enscrypt.h"

#include <limits>
#include <string>

#include "sqrl/crypto/provider.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/orchestrator/event_bus.h"
#include "sqrl/security/zeroizer.h"

namespace sqrl::crypto {

namespace {

ScryptParams MakeParams(uint8_t log_n_factor) {
  if (log_n_factor < core::ScryptConfig::kMinLogNFactor ||
      log_n_factor > core::ScryptConfig::kMaxLogNFactor) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kScryptConfigMalformed,
                      std::string(sqrl::errors::msg::kScryptLogNOutOfRange) + ": " +
                          std::to_string(log_n_factor)};
  }
  ScryptParams params{};
  params.n = uint64_t{1} << log_n_factor;
  params.r = kEnScryptBlockSize;
  params.p = kEnScryptParallelism;
  return params;
}

// Runs one scrypt round, chaining |salt_state| forward and folding into |accumulator|.
void EnScryptRound(CryptoProvider& provider,
                   std::span<const uint8_t> password,
                   std::span<const uint8_t> salt,
                   const ScryptParams& params,
                   std::array<uint8_t, kEnScryptKeySize>& round_output,
                   std::array<uint8_t, kEnScryptKeySize>& accumulator) {
  provider.Scrypt(password, salt, params, std::span<uint8_t>(round_output.data(), round_output.size()));
  for (std::size_t i = 0; i < accumulator.size(); ++i) {
    accumulator[i] ^= round_output[i];
  }
}

void PublishCalibrated(const core::ScryptConfig& config, uint8_t effort_seconds,
                       std::chrono::steady_clock::duration elapsed) {
  sqrl::orchestrator::Event event{};
  event.category = sqrl::orchestrator::EventCategory::kDiagnostics;
  event.severity = sqrl::orchestrator::EventSeverity::kDebug;
  event.event_id = "enscrypt_calibrated";
  event.message = "EnScrypt iteration count calibrated";
  event.fields.emplace_back("log_n_factor", std::to_string(config.log_n_factor),
                            sqrl::orchestrator::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("iterations", std::to_string(config.iteration_count),
                            sqrl::orchestrator::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("effort_seconds", std::to_string(effort_seconds),
                            sqrl::orchestrator::FieldPrivacy::kPublic, true);
  event.fields.emplace_back(
      "elapsed_ms",
      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()),
      sqrl::orchestrator::FieldPrivacy::kPublic, true);
  sqrl::orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

std::array<uint8_t, kEnScryptKeySize> EnScrypt(std::span<const uint8_t> password,
                                                std::span<const uint8_t> salt,
                                                uint8_t log_n_factor,
                                                uint32_t iterations) {
  if (iterations == 0) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kScryptConfigMalformed,
                      std::string(sqrl::errors::msg::kEnScryptIterationsNotPositive)};
  }
  const auto params = MakeParams(log_n_factor);
  auto provider = GetCryptoProviderShared();

  std::array<uint8_t, kEnScryptKeySize> accumulator{};
  std::array<uint8_t, kEnScryptKeySize> round_output{};
  std::array<uint8_t, kEnScryptKeySize> chained_salt{};
  security::Zeroizer::ScopeWiper<uint8_t> accumulator_guard(accumulator.data(), accumulator.size());
  security::Zeroizer::ScopeWiper<uint8_t> round_guard(round_output.data(), round_output.size());
  security::Zeroizer::ScopeWiper<uint8_t> salt_guard(chained_salt.data(), chained_salt.size());

  EnScryptRound(*provider, password, salt, params, round_output, accumulator);
  for (uint32_t i = 1; i < iterations; ++i) {
    chained_salt = round_output;
    EnScryptRound(*provider, password,
                  std::span<const uint8_t>(chained_salt.data(), chained_salt.size()), params,
                  round_output, accumulator);
  }

  auto key = accumulator;
  return key;
}

EnScryptCalibration EnScryptForDuration(std::span<const uint8_t> password,
                                        std::span<const uint8_t> salt,
                                        uint8_t log_n_factor,
                                        std::chrono::milliseconds duration) {
  const auto params = MakeParams(log_n_factor);
  auto provider = GetCryptoProviderShared();

  std::array<uint8_t, kEnScryptKeySize> round_output{};
  std::array<uint8_t, kEnScryptKeySize> chained_salt{};
  security::Zeroizer::ScopeWiper<uint8_t> round_guard(round_output.data(), round_output.size());
  security::Zeroizer::ScopeWiper<uint8_t> salt_guard(chained_salt.data(), chained_salt.size());

  EnScryptCalibration result{};
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + duration;

  EnScryptRound(*provider, password, salt, params, round_output, result.key);
  result.iterations = 1;
  while (std::chrono::steady_clock::now() < deadline &&
         result.iterations < std::numeric_limits<uint32_t>::max()) {
    chained_salt = round_output;
    EnScryptRound(*provider, password,
                  std::span<const uint8_t>(chained_salt.data(), chained_salt.size()), params,
                  round_output, result.key);
    ++result.iterations;
  }
  return result;
}

std::array<uint8_t, kEnScryptKeySize> DeriveKey(std::span<const uint8_t> password,
                                                 core::ScryptConfig& config,
                                                 uint8_t effort_seconds) {
  const auto salt = std::span<const uint8_t>(config.salt.data(), config.salt.size());
  if (config.iteration_count != 0) {
    return EnScrypt(password, salt, config.log_n_factor, config.iteration_count);
  }
  if (effort_seconds == 0) {
    throw sqrl::Error{sqrl::ErrorDomain::Config, sqrl::errors::config::kInvalidEnScryptParameter,
                      std::string(sqrl::errors::msg::kInvalidEffort)};
  }

  const auto start = std::chrono::steady_clock::now();
  auto calibration = EnScryptForDuration(password, salt, config.log_n_factor,
                                         std::chrono::seconds(effort_seconds));
  security::Zeroizer::ScopeWiper<uint8_t> key_guard(calibration.key.data(), calibration.key.size());
  config.iteration_count = calibration.iterations;
  PublishCalibrated(config, effort_seconds, std::chrono::steady_clock::now() - start);
  auto key = calibration.key;
  return key;
}

}  // namespace sqrl::crypto
