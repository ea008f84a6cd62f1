#include "sqrl/storage/block.h"

#include <string>

#include "sqrl/common.h"
#include "sqrl/error.h"
#include "sqrl/errors.h"

namespace sqrl::storage {

std::span<const uint8_t> ByteCursor::Next(std::size_t count) {
  if (count > remaining()) {
    throw sqrl::Error{sqrl::ErrorDomain::Validation, sqrl::errors::validation::kBlockTruncated,
                      std::string(sqrl::errors::msg::kBlockTruncated) + ": need " +
                          std::to_string(count) + " bytes, " + std::to_string(remaining()) +
                          " available"};
  }
  auto bytes = buffer_.subspan(offset_, count);
  offset_ += count;
  return bytes;
}

uint8_t ByteCursor::NextU8() {
  return Next(1)[0];
}

uint16_t ByteCursor::NextU16() {
  auto bytes = Next(sizeof(uint16_t));
  return sqrl::LoadLittleEndian16(std::span<const uint8_t, 2>(bytes.data(), 2));
}

uint32_t ByteCursor::NextU32() {
  auto bytes = Next(sizeof(uint32_t));
  return sqrl::LoadLittleEndian32(std::span<const uint8_t, 4>(bytes.data(), 4));
}

RecordHeader ReadRecordHeader(ByteCursor& cursor) {
  RecordHeader header{};
  header.length = cursor.NextU16();
  header.type = cursor.NextU16();
  return header;
}

void WriteRecordHeader(std::vector<uint8_t>& out, uint16_t length, BlockType type) {
  std::array<uint8_t, kRecordHeaderSize> header{};
  sqrl::StoreLittleEndian16(std::span<uint8_t, 2>(header.data(), 2), length);
  sqrl::StoreLittleEndian16(std::span<uint8_t, 2>(header.data() + 2, 2),
                            static_cast<uint16_t>(type));
  out.insert(out.end(), header.begin(), header.end());
}

std::vector<uint8_t> EncodeRecord(const DataBlock& block) {
  std::vector<uint8_t> out;
  out.reserve(block.DeclaredLength());
  WriteRecordHeader(out, block.DeclaredLength(), block.Type());
  block.EncodeBody(out);
  if (out.size() != block.DeclaredLength()) {
    throw sqrl::Error{sqrl::ErrorDomain::Internal, sqrl::errors::internal::kRecordLengthMismatch,
                      std::string(sqrl::errors::msg::kRecordLengthMismatch),
                      static_cast<int>(out.size())};
  }
  return out;
}

}  // namespace sqrl::storage
