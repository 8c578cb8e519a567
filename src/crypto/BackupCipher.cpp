#include "crypto/BackupCipher.hpp"
#include "crypto/util/encrypt.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace cuisine::crypto::util;
using namespace cuisine::logging;

namespace cuisine::crypto {

static constexpr size_t HEADER_SIZE = BACKUP_HEADER.size();
static constexpr size_t MIN_BLOB_SIZE = HEADER_SIZE + BACKUP_SALT_SIZE + AES_IV_SIZE + AES_TAG_SIZE;

std::vector<uint8_t> encryptBackup(const std::string_view json, const std::string_view password) {
    const auto salt = random_bytes(BACKUP_SALT_SIZE);
    auto key = derive_key_pbkdf2_sha256(password, salt, BACKUP_KDF_ITERATIONS);

    const std::vector<uint8_t> plaintext(json.begin(), json.end());
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    try {
        ciphertext = encrypt_aes256_gcm(plaintext, key, iv);
    } catch (...) {
        wipe(key);
        throw;
    }
    wipe(key);

    std::vector<uint8_t> blob;
    blob.reserve(HEADER_SIZE + salt.size() + iv.size() + ciphertext.size());
    blob.insert(blob.end(), BACKUP_HEADER.begin(), BACKUP_HEADER.end());
    blob.insert(blob.end(), salt.begin(), salt.end());
    blob.insert(blob.end(), iv.begin(), iv.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());

    LogRegistry::crypto()->debug("[encryptBackup] Encrypted {} bytes into {} byte blob", json.size(), blob.size());
    return blob;
}

bool isEncryptedBackup(const std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) return false;
    return std::equal(BACKUP_HEADER.begin(), BACKUP_HEADER.end(), data.begin(),
                      [](const char h, const uint8_t b) { return static_cast<uint8_t>(h) == b; });
}

std::string decryptBackup(const std::span<const uint8_t> blob, const std::string_view password) {
    if (blob.size() < MIN_BLOB_SIZE || !isEncryptedBackup(blob)) {
        LogRegistry::crypto()->warn("[decryptBackup] Rejected blob of {} bytes: not an encrypted backup", blob.size());
        throw DecryptionError();
    }

    const auto saltBegin = blob.begin() + HEADER_SIZE;
    const auto ivBegin = saltBegin + BACKUP_SALT_SIZE;
    const auto ctBegin = ivBegin + AES_IV_SIZE;

    const std::vector<uint8_t> salt(saltBegin, ivBegin);
    const std::vector<uint8_t> iv(ivBegin, ctBegin);
    const std::vector<uint8_t> ciphertext(ctBegin, blob.end());

    std::vector<uint8_t> key;
    std::vector<uint8_t> plaintext;
    try {
        key = derive_key_pbkdf2_sha256(password, salt, BACKUP_KDF_ITERATIONS);
        plaintext = decrypt_aes256_gcm(ciphertext, key, iv);
    } catch (const std::exception& e) {
        wipe(key);
        LogRegistry::crypto()->warn("[decryptBackup] {}", e.what());
        throw DecryptionError();
    }
    wipe(key);

    std::string out(plaintext.begin(), plaintext.end());
    wipe(plaintext);
    return out;
}

}
