#include "crypto/util/encrypt.hpp"
#include "logging/LogRegistry.hpp"

#include <sodium.h>
#include <openssl/evp.h>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace cuisine::crypto::util {

void ensure_sodium() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
}

std::vector<uint8_t> random_bytes(const size_t count) {
    ensure_sodium();
    std::vector<uint8_t> buf(count);
    randombytes_buf(buf.data(), buf.size());
    return buf;
}

std::vector<uint8_t> derive_key_pbkdf2_sha256(
    const std::string_view password,
    const std::vector<uint8_t>& salt,
    const unsigned int iterations,
    const size_t key_len)
{
    if (iterations == 0 || key_len == 0) throw std::invalid_argument("Invalid PBKDF2 parameters");

    std::vector<uint8_t> key(key_len);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1)
    {
        logging::LogRegistry::crypto()->error("[derive_key_pbkdf2_sha256] PBKDF2 derivation failed");
        throw std::runtime_error("PBKDF2 key derivation failed");
    }

    return key;
}

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("Failed to allocate cipher context");
    return ctx;
}

}

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv)
{
    if (key.size() != AES_KEY_SIZE) {
        logging::LogRegistry::crypto()->error("[encrypt_aes256_gcm] Invalid AES-256 key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid AES-256 key size");
    }

    out_iv = random_bytes(AES_IV_SIZE);

    const auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(AES_IV_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out_iv.data()) != 1)
    {
        logging::LogRegistry::crypto()->error("[encrypt_aes256_gcm] Cipher initialization failed");
        throw std::runtime_error("Encryption failed");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
        throw std::runtime_error("Encryption failed");
    size_t ciphertext_len = static_cast<size_t>(len);

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1)
        throw std::runtime_error("Encryption failed");
    ciphertext_len += static_cast<size_t>(len);

    // Tag goes right after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(AES_TAG_SIZE),
                            ciphertext.data() + ciphertext_len) != 1)
        throw std::runtime_error("Encryption failed: could not read tag");

    ciphertext.resize(ciphertext_len + AES_TAG_SIZE);
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        logging::LogRegistry::crypto()->error("[decrypt_aes256_gcm] Invalid key or IV size: "
                                              "key size = {}, iv size = {}",
                                              key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }

    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw std::runtime_error("Decryption failed: ciphertext too short");

    const size_t body_len = ciphertext_with_tag.size() - AES_TAG_SIZE;
    std::vector<uint8_t> tag(ciphertext_with_tag.end() - AES_TAG_SIZE, ciphertext_with_tag.end());

    const auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(AES_IV_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1)
    {
        logging::LogRegistry::crypto()->error("[decrypt_aes256_gcm] Cipher initialization failed");
        throw std::runtime_error("Decryption failed");
    }

    // One spare byte keeps data() valid for an empty body
    std::vector<uint8_t> decrypted(body_len + 1);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), decrypted.data(), &len,
                          ciphertext_with_tag.data(), static_cast<int>(body_len)) != 1)
    {
        wipe(decrypted);
        throw std::runtime_error("Decryption failed");
    }
    size_t decrypted_len = static_cast<size_t>(len);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(AES_TAG_SIZE), tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), decrypted.data() + decrypted_len, &len) != 1)
    {
        wipe(decrypted);
        throw std::runtime_error("Decryption failed: authentication error");
    }
    decrypted_len += static_cast<size_t>(len);

    decrypted.resize(decrypted_len);
    return decrypted;
}

void wipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) sodium_memzero(buf.data(), buf.size());
    buf.clear();
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    ensure_sodium();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    ensure_sodium();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        throw std::runtime_error("Invalid base64 data");
    }
    decoded.resize(out_len);
    return decoded;
}

}
