#include <gtest/gtest.h>
#include "database/RecordRows.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace cuisine::database;
using namespace cuisine::types;
using cuisine::test::sampleDataset;
using nlohmann::json;

TEST(RecordRowsTest, OneRowPerRecordWithPositionsPerCollection) {
    const auto rows = toRecordRows(sampleDataset());
    ASSERT_EQ(rows.size(), sampleDataset().totalRecords());

    for (const auto c : ALL_COLLECTIONS) {
        const auto name = to_string(c);
        int64_t expected = 0;
        for (const auto& row : rows) {
            if (row.collection != name) continue;
            EXPECT_EQ(row.position, expected++) << name;
        }
        EXPECT_EQ(static_cast<size_t>(expected), sampleDataset().size(c)) << name;
    }

    EXPECT_EQ(rows.front().collection, "equipment");
    EXPECT_EQ(rows.front().id, "eq-1");
    EXPECT_EQ(rows[1].id, "eq-2");
    EXPECT_EQ(rows.back().collection, "settings");
    EXPECT_EQ(rows.back().id, "default");
}

TEST(RecordRowsTest, DocumentsKeepTheStorageForm) {
    const auto rows = toRecordRows(sampleDataset());

    for (const auto& row : rows)
        EXPECT_EQ(json::parse(row.doc).at("id").get<std::string>(), row.id);

    const auto trace = std::find_if(rows.begin(), rows.end(), [](const RecordRow& r) { return r.id == "p-1"; });
    ASSERT_NE(trace, rows.end());
    EXPECT_EQ(trace->collection, "productTraces");
    EXPECT_TRUE(json::parse(trace->doc).contains("photo"));

    const auto settings = json::parse(rows.back().doc);
    EXPECT_EQ(settings.at("ocrApiKey").get<std::string>(), "sk-secret");
}

TEST(RecordRowsTest, RowsRebuildTheDatasetInAnyOrder) {
    auto rows = toRecordRows(sampleDataset());
    std::reverse(rows.begin(), rows.end());
    EXPECT_EQ(fromRecordRows(rows), sampleDataset());
}

TEST(RecordRowsTest, EmptyDatasetHasNoRows) {
    EXPECT_TRUE(toRecordRows(Dataset{}).empty());
    EXPECT_TRUE(fromRecordRows({}).empty());
}

TEST(RecordRowsTest, UnknownCollectionThrows) {
    std::vector<RecordRow> rows{{.collection = "recipes", .id = "r-1", .position = 0, .doc = R"({"id":"r-1"})"}};
    EXPECT_THROW((void)fromRecordRows(rows), std::invalid_argument);
}
