#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sqrl::core {

inline constexpr std::size_t kRescueCodeDigits = 24;
inline constexpr std::size_t kRescueCodeGroupSize = 4;

// 24 uniformly random decimal digits, formatted as six dash-separated groups
// of four ("1234-5678-...").
std::string GenerateRescueCode();

// Groups a bare 24-digit code for display. Throws sqrl::Error{Validation} when
// |digits| is not exactly 24 decimal digits.
std::string FormatRescueCode(std::string_view digits);

// Strips dashes and whitespace and returns the 24 digits that act as the
// EnScrypt password. Throws sqrl::Error{Validation, kRescueCodeMalformed}.
std::string NormalizeRescueCode(std::string_view input);
std::optional<std::string> TryNormalizeRescueCode(std::string_view input);

}  // namespace sqrl::core
