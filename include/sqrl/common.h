#pragma once
#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <span>
#include <type_traits>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace sqrl {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint16_t ByteSwap16(std::uint16_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ushort(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap16(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint32_t ByteSwap32(std::uint32_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ulong(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap32(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint16_t ToLittleEndian16(std::uint16_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap16(value);
}

inline constexpr std::uint32_t ToLittleEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap32(value);
}

inline constexpr std::uint16_t FromLittleEndian16(std::uint16_t value) noexcept {
  return ToLittleEndian16(value);
}

inline constexpr std::uint32_t FromLittleEndian32(std::uint32_t value) noexcept {
  return ToLittleEndian32(value);
}

// Little-endian field writers used by the block encoders.
inline void StoreLittleEndian16(std::span<std::uint8_t, 2> out, std::uint16_t value) noexcept {
  const std::uint16_t le = ToLittleEndian16(value);
  std::memcpy(out.data(), &le, sizeof(le));
}

inline void StoreLittleEndian32(std::span<std::uint8_t, 4> out, std::uint32_t value) noexcept {
  const std::uint32_t le = ToLittleEndian32(value);
  std::memcpy(out.data(), &le, sizeof(le));
}

inline std::uint16_t LoadLittleEndian16(std::span<const std::uint8_t, 2> in) noexcept {
  std::uint16_t le = 0;
  std::memcpy(&le, in.data(), sizeof(le));
  return FromLittleEndian16(le);
}

inline std::uint32_t LoadLittleEndian32(std::span<const std::uint8_t, 4> in) noexcept {
  std::uint32_t le = 0;
  std::memcpy(&le, in.data(), sizeof(le));
  return FromLittleEndian32(le);
}

template <std::size_t N>
[[nodiscard]] constexpr bool IsAllZero(const std::array<std::uint8_t, N>& bytes) noexcept {
  std::uint8_t acc = 0;
  for (auto byte : bytes) {
    acc |= byte;
  }
  return acc == 0;
}
} // namespace sqrl
