#include "sqrl/core/rescue_code.h"

#include <cctype>
#include <utility>

#include "sqrl/crypto/random.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"
#include "sqrl/security/zeroizer.h"

namespace sqrl::core {

namespace {

bool IsSeparator(char ch) {
  return ch == '-' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsDigit(char ch) {
  return ch >= '0' && ch <= '9';
}

[[noreturn]] void ThrowMalformed() {
  throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kRescueCodeMalformed,
                    std::string(sqrl::errors::msg::kRescueCodeMalformed)};
}

}  // namespace

std::string GenerateRescueCode() {
  std::string digits;
  digits.reserve(kRescueCodeDigits);
  for (std::size_t i = 0; i < kRescueCodeDigits; ++i) {
    digits.push_back(static_cast<char>('0' + crypto::RandomUniform(10)));
  }
  auto formatted = FormatRescueCode(digits);
  security::Zeroizer::WipeString(digits);
  return formatted;
}

std::string FormatRescueCode(std::string_view digits) {
  if (digits.size() != kRescueCodeDigits) {
    ThrowMalformed();
  }
  std::string out;
  out.reserve(kRescueCodeDigits + kRescueCodeDigits / kRescueCodeGroupSize - 1);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (!IsDigit(digits[i])) {
      security::Zeroizer::WipeString(out);
      ThrowMalformed();
    }
    if (i != 0 && i % kRescueCodeGroupSize == 0) {
      out.push_back('-');
    }
    out.push_back(digits[i]);
  }
  return out;
}

std::optional<std::string> TryNormalizeRescueCode(std::string_view input) {
  std::string digits;
  digits.reserve(kRescueCodeDigits);
  for (char ch : input) {
    if (IsSeparator(ch)) {
      continue;
    }
    if (!IsDigit(ch) || digits.size() == kRescueCodeDigits) {
      security::Zeroizer::WipeString(digits);
      return std::nullopt;
    }
    digits.push_back(ch);
  }
  if (digits.size() != kRescueCodeDigits) {
    security::Zeroizer::WipeString(digits);
    return std::nullopt;
  }
  return digits;
}

std::string NormalizeRescueCode(std::string_view input) {
  auto digits = TryNormalizeRescueCode(input);
  if (!digits) {
    ThrowMalformed();
  }
  return std::move(*digits);
}

}  // namespace sqrl::core
