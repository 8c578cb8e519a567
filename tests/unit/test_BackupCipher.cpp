#include <gtest/gtest.h>
#include "crypto/BackupCipher.hpp"
#include "crypto/util/encrypt.hpp"

#include <string>
#include <vector>

using namespace cuisine::crypto;

namespace {

constexpr size_t OVERHEAD = BACKUP_HEADER.size() + BACKUP_SALT_SIZE + 12 + 16;

std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

std::vector<uint8_t> hex(const std::string& s) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < s.size(); i += 2)
        out.push_back(static_cast<uint8_t>(std::stoi(s.substr(i, 2), nullptr, 16)));
    return out;
}

}

TEST(BackupCipherTest, RoundTripsWithTheRightPassword) {
    const std::string json = R"({"version":1,"exportedAt":"2024-03-01T08:00:00.000Z"})";
    const auto blob = encryptBackup(json, "s3cret");

    EXPECT_TRUE(isEncryptedBackup(blob));
    EXPECT_EQ(blob.size(), json.size() + OVERHEAD);
    EXPECT_EQ(decryptBackup(blob, "s3cret"), json);
}

TEST(BackupCipherTest, WrongPasswordFails) {
    const std::string json(10 * 1024, 'x');
    const auto blob = encryptBackup(json, "correct-horse");
    EXPECT_THROW((void)decryptBackup(blob, "wrong-horse"), DecryptionError);
    EXPECT_EQ(decryptBackup(blob, "correct-horse"), json);
}

TEST(BackupCipherTest, BlobStartsWithHeader) {
    const auto blob = encryptBackup("{}", "pw");
    const std::string head(blob.begin(), blob.begin() + static_cast<long>(BACKUP_HEADER.size()));
    EXPECT_EQ(head, "CUISINE_ENC_V1");
}

TEST(BackupCipherTest, SaltAndIvAreFreshPerCall) {
    const auto a = encryptBackup("{}", "pw");
    const auto b = encryptBackup("{}", "pw");
    ASSERT_EQ(a.size(), b.size());
    EXPECT_NE(a, b);

    const auto saltA = std::vector<uint8_t>(a.begin() + 14, a.begin() + 30);
    const auto saltB = std::vector<uint8_t>(b.begin() + 14, b.begin() + 30);
    EXPECT_NE(saltA, saltB);
}

TEST(BackupCipherTest, TamperedCiphertextFails) {
    auto blob = encryptBackup("{\"version\":1}", "pw");
    blob[blob.size() - 20] ^= 0x01;
    EXPECT_THROW((void)decryptBackup(blob, "pw"), DecryptionError);
}

TEST(BackupCipherTest, TamperedSaltFails) {
    auto blob = encryptBackup("{\"version\":1}", "pw");
    blob[BACKUP_HEADER.size()] ^= 0x80;
    EXPECT_THROW((void)decryptBackup(blob, "pw"), DecryptionError);
}

TEST(BackupCipherTest, TruncatedBlobFails) {
    const auto blob = encryptBackup("{}", "pw");
    const std::vector<uint8_t> truncated(blob.begin(), blob.end() - 1);
    EXPECT_THROW((void)decryptBackup(truncated, "pw"), DecryptionError);

    const std::vector<uint8_t> headerOnly(blob.begin(), blob.begin() + static_cast<long>(BACKUP_HEADER.size()));
    EXPECT_THROW((void)decryptBackup(headerOnly, "pw"), DecryptionError);
}

TEST(BackupCipherTest, PlainJsonIsNotEncrypted) {
    EXPECT_FALSE(isEncryptedBackup(bytes("{\"version\":1}")));
    EXPECT_FALSE(isEncryptedBackup(bytes("CUISINE_ENC")));
    EXPECT_FALSE(isEncryptedBackup({}));
    EXPECT_THROW((void)decryptBackup(bytes("{\"version\":1,\"exportedAt\":\"2024-03-01\"}"), "pw"), DecryptionError);
}

TEST(BackupCipherTest, HeaderAloneIsDetectedAsEncrypted) {
    EXPECT_TRUE(isEncryptedBackup(bytes("CUISINE_ENC_V1 garbage")));
}

TEST(BackupCipherTest, EmptyPlaintextRoundTrips) {
    const auto blob = encryptBackup("", "pw");
    EXPECT_EQ(blob.size(), OVERHEAD);
    EXPECT_EQ(decryptBackup(blob, "pw"), "");
}

TEST(BackupCipherTest, Utf8PasswordsWork) {
    const auto blob = encryptBackup("{}", "crème brûlée");
    EXPECT_EQ(decryptBackup(blob, "crème brûlée"), "{}");
    EXPECT_THROW((void)decryptBackup(blob, "creme brulee"), DecryptionError);
}

// McGrew & Viega GCM test case 14: zero key, zero IV, one zero block
TEST(AesGcmTest, DecryptsKnownAnswerVector) {
    const std::vector<uint8_t> key(util::AES_KEY_SIZE, 0);
    const std::vector<uint8_t> iv(util::AES_IV_SIZE, 0);
    const auto sealed = hex("cea7403d4d606b6e074ec5d3baf39d18"
                            "d0d1c8a799996bf0265b98b5d48ab919");

    EXPECT_EQ(util::decrypt_aes256_gcm(sealed, key, iv), std::vector<uint8_t>(16, 0));
}

TEST(AesGcmTest, EncryptAppendsTagAndFillsIv) {
    const auto key = util::random_bytes(util::AES_KEY_SIZE);
    const auto plain = bytes("Crème fraîche");
    std::vector<uint8_t> iv;

    const auto sealed = util::encrypt_aes256_gcm(plain, key, iv);
    EXPECT_EQ(iv.size(), util::AES_IV_SIZE);
    EXPECT_EQ(sealed.size(), plain.size() + util::AES_TAG_SIZE);
    EXPECT_EQ(util::decrypt_aes256_gcm(sealed, key, iv), plain);

    std::vector<uint8_t> emptyIv;
    const auto emptySealed = util::encrypt_aes256_gcm({}, key, emptyIv);
    EXPECT_EQ(emptySealed.size(), util::AES_TAG_SIZE);
    EXPECT_TRUE(util::decrypt_aes256_gcm(emptySealed, key, emptyIv).empty());
}

TEST(AesGcmTest, TamperedTagOrWrongKeyThrows) {
    const auto key = util::random_bytes(util::AES_KEY_SIZE);
    std::vector<uint8_t> iv;
    auto sealed = util::encrypt_aes256_gcm(bytes("{}"), key, iv);

    auto otherKey = key;
    otherKey[0] ^= 0x01;
    EXPECT_THROW((void)util::decrypt_aes256_gcm(sealed, otherKey, iv), std::runtime_error);

    sealed.back() ^= 0x01;
    EXPECT_THROW((void)util::decrypt_aes256_gcm(sealed, key, iv), std::runtime_error);
}

TEST(AesGcmTest, RejectsBadKeyAndIvSizes) {
    std::vector<uint8_t> iv;
    EXPECT_THROW((void)util::encrypt_aes256_gcm(bytes("x"), std::vector<uint8_t>(16, 0), iv), std::invalid_argument);
    EXPECT_THROW((void)util::decrypt_aes256_gcm(std::vector<uint8_t>(32, 0), std::vector<uint8_t>(32, 0),
                                                std::vector<uint8_t>(8, 0)), std::invalid_argument);
    EXPECT_THROW((void)util::decrypt_aes256_gcm(std::vector<uint8_t>(4, 0), std::vector<uint8_t>(32, 0),
                                                std::vector<uint8_t>(12, 0)), std::runtime_error);
}
