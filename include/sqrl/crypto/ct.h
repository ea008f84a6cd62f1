#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace sqrl::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff = diff | (a[i] ^ b[i]);
  return diff == 0;
}

} // namespace sqrl::crypto::ct
