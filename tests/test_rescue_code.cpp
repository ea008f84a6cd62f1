#include "sqrl/core/rescue_code.h"
#include "sqrl/error.h"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

void TestGeneratedCodeShape() {
  std::set<std::string> seen;
  for (int round = 0; round < 16; ++round) {
    auto code = sqrl::core::GenerateRescueCode();
    assert(code.size() == 29 && "six groups of four digits with five dashes");
    for (size_t i = 0; i < code.size(); ++i) {
      if (i % 5 == 4) {
        assert(code[i] == '-' && "dash expected between groups");
      } else {
        assert(code[i] >= '0' && code[i] <= '9' && "only decimal digits expected");
      }
    }
    auto digits = sqrl::core::NormalizeRescueCode(code);
    assert(digits.size() == sqrl::core::kRescueCodeDigits);
    assert(sqrl::core::FormatRescueCode(digits) == code && "format must invert normalize");
    seen.insert(digits);
  }
  assert(seen.size() == 16 && "generated codes must not repeat");
}

void TestNormalizeAcceptsSeparators() {
  const std::string digits = "012345678901234567890123";
  assert(sqrl::core::NormalizeRescueCode(digits) == digits);
  assert(sqrl::core::NormalizeRescueCode("0123-4567-8901-2345-6789-0123") == digits);
  assert(sqrl::core::NormalizeRescueCode(" 0123 4567\t8901-2345 6789-0123 ") == digits);
  assert(sqrl::core::FormatRescueCode(digits) == "0123-4567-8901-2345-6789-0123");
}

void TestNormalizeRejectsMalformed() {
  const char* malformed[] = {
      "",
      "0123-4567-8901-2345-6789-012",
      "0123-4567-8901-2345-6789-01234",
      "0123-4567-8901-2345-6789-012a",
      "0123_4567_8901_2345_6789_0123",
  };
  for (const char* input : malformed) {
    assert(!sqrl::core::TryNormalizeRescueCode(input).has_value());
    bool threw = false;
    try {
      (void)sqrl::core::NormalizeRescueCode(input);
    } catch (const sqrl::Error& err) {
      threw = err.domain == sqrl::ErrorDomain::Validation &&
              err.code == sqrl::errors::validation::kRescueCodeMalformed;
    }
    assert(threw && "malformed rescue code must raise a validation error");
  }

  bool threw = false;
  try {
    (void)sqrl::core::FormatRescueCode("01234567890123456789012x");
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Validation;
  }
  assert(threw && "format must reject non-digits");
}

} // namespace

int main() {
  TestGeneratedCodeShape();
  TestNormalizeAcceptsSeparators();
  TestNormalizeRejectsMalformed();
  std::cout << "rescue code test ok\n";
  return 0;
}
