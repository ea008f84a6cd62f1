#include "sqrl/core/scrypt_config.h"
#include "sqrl/error.h"
#include "sqrl/storage/block.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <vector>

namespace {

void TestCursorReadsLittleEndian() {
  const std::array<uint8_t, 7> data{0xAB, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12};
  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(data.data(), data.size()));
  assert(cursor.NextU8() == 0xAB);
  assert(cursor.NextU16() == 0x1234);
  assert(cursor.NextU32() == 0x12345678u);
  assert(cursor.remaining() == 0);
  assert(cursor.consumed() == data.size());
}

void TestCursorNeverZeroFills() {
  const std::array<uint8_t, 3> data{1, 2, 3};
  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(data.data(), data.size()));
  (void)cursor.NextU8();
  bool threw = false;
  try {
    (void)cursor.NextU32();
  } catch (const sqrl::Error& err) {
    threw = err.domain == sqrl::ErrorDomain::Validation &&
            err.code == sqrl::errors::validation::kBlockTruncated;
  }
  assert(threw && "short read must raise a truncation error");
  assert(cursor.consumed() == 1 && "failed read must not advance the cursor");
  assert(cursor.NextU16() == 0x0302);
}

void TestRecordHeaderRoundTrip() {
  std::vector<uint8_t> out;
  sqrl::storage::WriteRecordHeader(out, 73, sqrl::storage::BlockType::kRescueCode);
  const std::vector<uint8_t> expected{0x49, 0x00, 0x02, 0x00};
  assert(out == expected && "header must be u16 LE length then u16 LE type");
  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(out.data(), out.size()));
  auto header = sqrl::storage::ReadRecordHeader(cursor);
  assert(header.length == 73);
  assert(header.type == static_cast<uint16_t>(sqrl::storage::BlockType::kRescueCode));
}

void TestScryptConfigEncoding() {
  sqrl::core::ScryptConfig config{};
  for (size_t i = 0; i < config.salt.size(); ++i) {
    config.salt[i] = static_cast<uint8_t>(0x10 + i);
  }
  config.log_n_factor = 9;
  config.iteration_count = 0x01020304u;
  auto encoded = config.Encode();
  const std::array<uint8_t, sqrl::core::ScryptConfig::kEncodedSize> expected{
      0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17,
      0x18, 0x19, 0x1A, 0x1B, 0x1C, 0x1D, 0x1E, 0x1F, // salt
      0x09,                                           // log2(N)
      0x04, 0x03, 0x02, 0x01};                        // iteration count
  assert(encoded == expected && "scrypt config encoding must match golden vector");

  sqrl::storage::ByteCursor cursor(std::span<const uint8_t>(encoded.data(), encoded.size()));
  auto decoded = sqrl::core::ScryptConfig::Decode(cursor);
  assert(decoded == config);
  assert(cursor.remaining() == 0);

  auto bad = encoded;
  bad[16] = 0;
  bool threw = false;
  try {
    sqrl::storage::ByteCursor bad_cursor(std::span<const uint8_t>(bad.data(), bad.size()));
    (void)sqrl::core::ScryptConfig::Decode(bad_cursor);
  } catch (const sqrl::Error& err) {
    threw = err.code == sqrl::errors::validation::kScryptConfigMalformed;
  }
  assert(threw && "log2(N) of zero must be rejected");

  bad[16] = sqrl::core::ScryptConfig::kMaxLogNFactor + 1;
  threw = false;
  try {
    sqrl::storage::ByteCursor bad_cursor(std::span<const uint8_t>(bad.data(), bad.size()));
    (void)sqrl::core::ScryptConfig::Decode(bad_cursor);
  } catch (const sqrl::Error& err) {
    threw = err.code == sqrl::errors::validation::kScryptConfigMalformed;
  }
  assert(threw && "oversized log2(N) must be rejected");
}

void TestGeneratedConfigsDiffer() {
  auto a = sqrl::core::ScryptConfig::Generate();
  auto b = sqrl::core::ScryptConfig::Generate();
  assert(a.log_n_factor == sqrl::core::ScryptConfig::kDefaultLogNFactor);
  assert(a.iteration_count == 0);
  assert(a.salt != b.salt && "each config must get its own salt");
  auto before = a.salt;
  a.RefreshSalt();
  assert(a.salt != before && "refresh must replace the salt");
}

} // namespace

int main() {
  TestCursorReadsLittleEndian();
  TestCursorNeverZeroFills();
  TestRecordHeaderRoundTrip();
  TestScryptConfigEncoding();
  TestGeneratedConfigsDiffer();
  std::cout << "block io test ok\n";
  return 0;
}
