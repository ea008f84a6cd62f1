#pragma once

#include <string_view>

namespace sqrl::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kRescueCodeRejected{"Decryption failed. Check your rescue code"};
inline constexpr std::string_view kRescueCodeMalformed{"Rescue code must contain exactly 24 decimal digits"};
inline constexpr std::string_view kUnlockKeyNotProtected{"No identity unlock key has been protected yet"};
inline constexpr std::string_view kBlockTruncated{"Storage block truncated"};
inline constexpr std::string_view kBlockLengthMismatch{"Identity unlock block declared length mismatch"};
inline constexpr std::string_view kBlockTypeMismatch{"Unexpected block type for identity unlock block"};
inline constexpr std::string_view kScryptLogNOutOfRange{"Scrypt log2(N) factor out of range"};
inline constexpr std::string_view kScryptDerivationFailed{"EVP_PBE_scrypt derivation failed"};
inline constexpr std::string_view kInvalidEnScryptLogN{"SQRL_ENSCRYPT_LOG_N must be an integer between 1 and 14"};
inline constexpr std::string_view kInvalidEnScryptIterations{"SQRL_ENSCRYPT_ITERATIONS must be a positive integer"};
inline constexpr std::string_view kEnScryptIterationsNotPositive{"EnScrypt iteration count must be positive"};
inline constexpr std::string_view kSealingKeyConsumed{"Sealing key already consumed"};
inline constexpr std::string_view kUnexpectedCiphertextLength{"Unexpected AES-GCM ciphertext length"};
inline constexpr std::string_view kDecryptedSizeMismatch{"Decrypted size mismatch in sealed secret"};
inline constexpr std::string_view kRecordLengthMismatch{"Encoded record size differs from declared block length"};
inline constexpr std::string_view kInvalidEffort{"EnScrypt effort must be at least one second"};
}  // namespace sqrl::errors::msg
