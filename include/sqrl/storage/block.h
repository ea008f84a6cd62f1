#pragma once

// Storage block framing shared by all identity container block types.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sqrl::storage {

enum class BlockType : uint16_t {
  kUserAccess = 1,
  kRescueCode = 2,
  kPreviousIdentityKeys = 3,
};

// Every record starts with a little-endian u16 length (covering the whole
// record, framing included) followed by a little-endian u16 block type.
inline constexpr std::size_t kRecordHeaderSize = sizeof(uint16_t) * 2;

// Forward-only reader over a borrowed buffer. Every read either returns the
// requested bytes or throws sqrl::Error{Validation, kBlockTruncated}; nothing
// is zero-filled.
class ByteCursor {
 public:
  explicit ByteCursor(std::span<const uint8_t> buffer) noexcept : buffer_(buffer) {}

  std::span<const uint8_t> Next(std::size_t count);

  template <std::size_t N>
  std::array<uint8_t, N> NextArray() {
    std::array<uint8_t, N> out{};
    auto bytes = Next(N);
    for (std::size_t i = 0; i < N; ++i) {
      out[i] = bytes[i];
    }
    return out;
  }

  uint8_t NextU8();
  uint16_t NextU16();
  uint32_t NextU32();

  [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - offset_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return offset_; }

 private:
  std::span<const uint8_t> buffer_;
  std::size_t offset_{0};
};

struct RecordHeader {
  uint16_t length{0};
  uint16_t type{0};
};

RecordHeader ReadRecordHeader(ByteCursor& cursor);
void WriteRecordHeader(std::vector<uint8_t>& out, uint16_t length, BlockType type);

// Contract a block type implements so the container can frame it.
class DataBlock {
 public:
  virtual ~DataBlock() = default;

  [[nodiscard]] virtual BlockType Type() const noexcept = 0;
  [[nodiscard]] virtual uint16_t DeclaredLength() const noexcept = 0;
  // Appends the body only; the framing belongs to EncodeRecord().
  virtual void EncodeBody(std::vector<uint8_t>& out) const = 0;
};

// Length + type + body. Throws sqrl::Error{Internal} when the emitted record
// does not match the block's declared length.
std::vector<uint8_t> EncodeRecord(const DataBlock& block);

}  // namespace sqrl::storage
