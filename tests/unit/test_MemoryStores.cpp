#include <gtest/gtest.h>
#include "storage/MemoryStores.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace cuisine::storage;
using namespace cuisine::types;
using cuisine::test::sampleDataset;
using cuisine::test::ts;

TEST(MemoryDataStoreTest, BulkReplaceSwapsEveryCollection) {
    MemoryDataStore store(sampleDataset());
    Dataset next;
    next.tasks.push_back(sampleDataset().tasks[0]);

    store.bulkReplace(next);
    EXPECT_EQ(store.getAll(), next);

    store.clear();
    EXPECT_TRUE(store.getAll().empty());
}

TEST(MemoryDataStoreTest, DuplicateIdInACollectionIsRejected) {
    MemoryDataStore store(sampleDataset());

    auto dup = sampleDataset();
    dup.invoices.push_back(dup.invoices[0]);
    dup.invoices.back().supplier = "Promocash";

    EXPECT_THROW(store.bulkReplace(dup), std::invalid_argument);
    EXPECT_EQ(store.getAll(), sampleDataset());
}

TEST(MemoryDataStoreTest, SameIdInDifferentCollectionsIsAccepted) {
    MemoryDataStore store;
    auto data = sampleDataset();
    data.equipment[0].id = "shared";
    data.tasks[0].id = "shared";

    store.bulkReplace(data);
    EXPECT_EQ(store.getAll(), data);
}

TEST(MemoryDataStoreTest, IdsFollowRecordOrder) {
    const auto data = sampleDataset();
    EXPECT_EQ(data.ids(Collection::Equipment), (std::vector<std::string>{"eq-1", "eq-2"}));
    EXPECT_EQ(data.ids(Collection::Settings), std::vector<std::string>{"default"});
}

TEST(MemorySnapshotStoreTest, PutOverwritesAndCountsWrites) {
    MemorySnapshotStore store;
    EXPECT_FALSE(store.get("auto-weekly").has_value());

    store.put({.id = "auto-weekly", .payload = "{}", .created_at = ts("2024-03-01T08:00:00Z")});
    store.put({.id = "auto-weekly", .payload = "[]", .created_at = ts("2024-03-08T08:00:00Z")});
    ASSERT_TRUE(store.get("auto-weekly").has_value());
    EXPECT_EQ(store.get("auto-weekly")->payload, "[]");
    EXPECT_EQ(store.writeCount(), 2u);

    store.remove("auto-weekly");
    EXPECT_FALSE(store.get("auto-weekly").has_value());
}
