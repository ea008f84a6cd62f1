#pragma once

#include <cstdint>
#include <span>

namespace sqrl::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

// Uniformly distributed value in [0, upper_bound) without modulo bias.
uint32_t RandomUniform(uint32_t upper_bound);

}  // namespace sqrl::crypto
