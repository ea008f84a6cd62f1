#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace sqrl::security {

class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  static void WipeString(std::string& text) noexcept;

  // Wipes the viewed range when the scope ends unless released first.
  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}
    ScopeWiper(T* ptr, std::size_t count) noexcept : ScopeWiper(std::span<T>(ptr, count)) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ScopeWiper(ScopeWiper&&) = delete;
    ScopeWiper& operator=(ScopeWiper&&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      const std::size_t bytes = span_.size_bytes();
      auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()), bytes);
      Zeroizer::Wipe(byte_span);
    }

    void Release() noexcept { span_ = {}; }

  private:
    std::span<T> span_;
  };
};

} // namespace sqrl::security
