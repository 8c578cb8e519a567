#include <gtest/gtest.h>
#include "storage/FileKeyValueStore.hpp"
#include "backup/BackupState.hpp"
#include "test_helpers.hpp"

using namespace cuisine::storage;
using namespace cuisine::backup;
using cuisine::test::TempDir;
using cuisine::test::ts;

TEST(FileKeyValueStoreTest, SetGetRemove) {
    TempDir dir;
    FileKeyValueStore store(dir.path() / "prefs");

    EXPECT_FALSE(store.get("cuisine_backup_last_at").has_value());
    store.set("cuisine_backup_last_at", "2024-03-01T08:00:00.000Z");
    EXPECT_EQ(store.get("cuisine_backup_last_at"), "2024-03-01T08:00:00.000Z");

    store.set("cuisine_backup_last_at", "2024-03-08T08:00:00.000Z");
    EXPECT_EQ(store.get("cuisine_backup_last_at"), "2024-03-08T08:00:00.000Z");

    store.remove("cuisine_backup_last_at");
    EXPECT_FALSE(store.get("cuisine_backup_last_at").has_value());
    EXPECT_NO_THROW(store.remove("cuisine_backup_last_at"));
}

TEST(FileKeyValueStoreTest, CreatesItsRootDirectory) {
    TempDir dir;
    const auto root = dir.path() / "a" / "b";
    FileKeyValueStore store(root);
    EXPECT_TRUE(std::filesystem::is_directory(root));
}

TEST(FileKeyValueStoreTest, ValuesSurviveReopening) {
    TempDir dir;
    {
        FileKeyValueStore store(dir.path());
        store.set("snapshot", "{\"version\":1}\n");
    }
    FileKeyValueStore reopened(dir.path());
    EXPECT_EQ(reopened.get("snapshot"), "{\"version\":1}\n");
}

TEST(FileKeyValueStoreTest, EmptyValueIsStoredAsEmpty) {
    TempDir dir;
    FileKeyValueStore store(dir.path());
    store.set("flag", "");
    ASSERT_TRUE(store.get("flag").has_value());
    EXPECT_TRUE(store.get("flag")->empty());
}

TEST(FileKeyValueStoreTest, RejectsKeysThatEscapeTheRoot) {
    TempDir dir;
    FileKeyValueStore store(dir.path());
    for (const std::string key : {"", "../etc", "a/b", ".hidden", "clé"}) {
        EXPECT_THROW(store.set(key, "x"), std::invalid_argument) << key;
        EXPECT_THROW((void)store.get(key), std::invalid_argument) << key;
    }
}

TEST(FileKeyValueStoreTest, BacksBackupState) {
    TempDir dir;
    const auto prefs = std::make_shared<FileKeyValueStore>(dir.path());
    BackupState state(prefs);

    EXPECT_TRUE(state.isAutoBackupEnabled());
    state.setAutoBackupEnabled(false);
    EXPECT_EQ(prefs->get(AUTO_BACKUP_ENABLED_KEY), "0");

    state.markBackup(ts("2024-03-01T08:00:00Z"));
    BackupState reopened(std::make_shared<FileKeyValueStore>(dir.path()));
    EXPECT_FALSE(reopened.isAutoBackupEnabled());
    EXPECT_EQ(reopened.lastBackupAt(), ts("2024-03-01T08:00:00Z"));
}

TEST(FileKeyValueStoreTest, AnythingButZeroMeansEnabled) {
    TempDir dir;
    const auto prefs = std::make_shared<FileKeyValueStore>(dir.path());
    BackupState state(prefs);

    for (const std::string value : {"1", "true", "", "false"}) {
        prefs->set(AUTO_BACKUP_ENABLED_KEY, value);
        EXPECT_TRUE(state.isAutoBackupEnabled()) << value;
    }
    prefs->set(AUTO_BACKUP_ENABLED_KEY, "0");
    EXPECT_FALSE(state.isAutoBackupEnabled());
}
