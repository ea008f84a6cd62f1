#include "sqrl/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include <sodium.h>

namespace sqrl::security {

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }

    // sodium_memzero is not elided by the optimizer even for dead stores.
    ::sodium_memzero(data.data(), data.size());
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  void Zeroizer::WipeString(std::string& text) noexcept {
    if (text.empty()) {
      return;
    }
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
  }

} // namespace sqrl::security
