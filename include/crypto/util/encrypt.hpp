#pragma once

#include <vector>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuisine::crypto::util {

constexpr size_t AES_KEY_SIZE = 32;      // 256-bit
constexpr size_t AES_IV_SIZE  = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE = 16;      // GCM auth tag

// Throws if libsodium cannot be initialized. Safe to call repeatedly.
void ensure_sodium();

std::vector<uint8_t> random_bytes(size_t count);

// PBKDF2-HMAC-SHA256
std::vector<uint8_t> derive_key_pbkdf2_sha256(
    std::string_view password,
    const std::vector<uint8_t>& salt,
    unsigned int iterations,
    size_t key_len = AES_KEY_SIZE);

// Generates a fresh random IV into out_iv; returns ciphertext with the tag appended.
std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv);

// Throws std::runtime_error on authentication failure.
std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

void wipe(std::vector<uint8_t>& buf);

std::string b64_encode(const std::vector<uint8_t>& data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
