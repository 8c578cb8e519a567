#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cuisine::crypto {

// Encrypted backup layout: HEADER | salt (16) | iv (12) | ciphertext + GCM tag (16)
inline constexpr std::string_view BACKUP_HEADER = "CUISINE_ENC_V1";
constexpr size_t BACKUP_SALT_SIZE = 16;
constexpr unsigned int BACKUP_KDF_ITERATIONS = 100'000;

// Raised for every decryption failure. Wrong password and corrupted data are not told apart.
class DecryptionError : public std::runtime_error {
public:
    DecryptionError() : std::runtime_error("Backup decryption failed") {}
};

[[nodiscard]] std::vector<uint8_t> encryptBackup(std::string_view json, std::string_view password);

// Throws DecryptionError.
[[nodiscard]] std::string decryptBackup(std::span<const uint8_t> blob, std::string_view password);

[[nodiscard]] bool isEncryptedBackup(std::span<const uint8_t> data);

}
