#include <gtest/gtest.h>
#include "types/BackupPayload.hpp"
#include "test_helpers.hpp"

using namespace cuisine::types;
using cuisine::test::sampleDataset;
using cuisine::test::ts;
using nlohmann::json;

TEST(TypesTest, DatasetStorageFormRoundTrips) {
    const auto original = sampleDataset();
    const json j = original;
    EXPECT_EQ(j.get<Dataset>(), original);
}

TEST(TypesTest, StorageFormKeepsPhotosAndImages) {
    const json j = sampleDataset();
    EXPECT_EQ(j.at("productTraces")[0].at("photo").get<std::string>(), "/9j/4A==");
    EXPECT_EQ(j.at("invoices")[0].at("images")[0].get<std::string>(), "JVBERg==");
    EXPECT_EQ(j.at("settings")[0].at("ocrApiKey").get<std::string>(), "sk-secret");
}

TEST(TypesTest, OneOffTaskSerializesNullRecurrence) {
    const auto task = sampleDataset().tasks[1];
    const json j = task;
    ASSERT_TRUE(j.contains("recurring"));
    EXPECT_TRUE(j.at("recurring").is_null());
    EXPECT_FALSE(j.contains("notes"));
    EXPECT_EQ(j.at("completedAt").get<std::string>(), "2024-02-25T11:15:00.000Z");
}

TEST(TypesTest, StoredFormRejectsUnknownEnumStrings) {
    json j = sampleDataset().equipment[0];
    j["type"] = "walk_in";
    EXPECT_THROW(j.get<Equipment>(), std::invalid_argument);
}

TEST(TypesTest, DatasetFromJsonToleratesMissingCollections) {
    const json j = {{"equipment", sampleDataset().equipment}};
    const auto d = j.get<Dataset>();
    EXPECT_EQ(d.equipment.size(), 2u);
    EXPECT_TRUE(d.tasks.empty());
}

TEST(TypesTest, DatasetCounts) {
    const auto d = sampleDataset();
    EXPECT_EQ(d.size(Collection::Equipment), 2u);
    EXPECT_EQ(d.size(Collection::Tasks), 2u);
    EXPECT_EQ(d.totalRecords(), 10u);
    EXPECT_FALSE(d.empty());
    EXPECT_TRUE(Dataset{}.empty());
}

TEST(TypesTest, CollectionKeys) {
    EXPECT_EQ(to_string(Collection::TemperatureRecords), "temperatureRecords");
    EXPECT_EQ(to_string(Collection::PriceHistory), "priceHistory");
    for (const auto c : ALL_COLLECTIONS) EXPECT_EQ(collection_from_string(to_string(c)), c);
    EXPECT_FALSE(collection_from_string("recipes").has_value());
}

TEST(TypesTest, EnumStrings) {
    EXPECT_EQ(to_string(EquipmentType::ColdRoom), "cold_room");
    EXPECT_EQ(to_string(TaskCategory::MiseEnPlace), "mise_en_place");
    EXPECT_EQ(to_string(IngredientUnit::Unite), "unite");
    EXPECT_EQ(ingredient_unit_from_string("ml"), IngredientUnit::Ml);
    EXPECT_FALSE(task_priority_from_string("High").has_value());
    EXPECT_EQ(oil_action_from_string("changed"), OilAction::Changed);
}

TEST(TypesTest, PayloadDocumentIsFlat) {
    const BackupPayload payload{.version = 1, .exported_at = ts("2024-03-01T08:00:00Z"), .data = {}};
    const json j = payload;
    EXPECT_EQ(j.at("version"), 1);
    EXPECT_EQ(j.at("exportedAt").get<std::string>(), "2024-03-01T08:00:00.000Z");
    EXPECT_EQ(j.size(), 2u + ALL_COLLECTIONS.size());
}
