#include <gtest/gtest.h>
#include "backup/PayloadBuilder.hpp"
#include "backup/PayloadValidator.hpp"
#include "storage/MemoryStores.hpp"
#include "test_helpers.hpp"

using namespace cuisine::backup;
using namespace cuisine::storage;
using namespace cuisine::types;
using cuisine::test::ManualClock;
using cuisine::test::minimalDocument;
using cuisine::test::sampleDataset;
using nlohmann::json;

class PayloadBuilderTest : public ::testing::Test {
protected:
    ManualClock clock;
    std::shared_ptr<MemoryDataStore> store = std::make_shared<MemoryDataStore>(sampleDataset());
    PayloadBuilder builder{store, clock.clock()};
};

TEST_F(PayloadBuilderTest, BuildStampsVersionAndClock) {
    const auto payload = builder.build();
    EXPECT_EQ(payload.version, CURRENT_BACKUP_VERSION);
    EXPECT_EQ(payload.exported_at, clock.now);
    EXPECT_EQ(payload.data.totalRecords(), sampleDataset().totalRecords());
}

TEST_F(PayloadBuilderTest, StripRemovesBinariesAndCredentials) {
    const auto stripped = PayloadBuilder::stripForExport(sampleDataset());
    EXPECT_FALSE(stripped.product_traces[0].photo.has_value());
    EXPECT_TRUE(stripped.invoices[0].images.empty());
    EXPECT_FALSE(stripped.settings[0].ocr_api_key.has_value());

    EXPECT_EQ(stripped.product_traces[0].photo_url, sampleDataset().product_traces[0].photo_url);
    EXPECT_EQ(stripped.invoices[0].items, sampleDataset().invoices[0].items);
    EXPECT_EQ(stripped.settings[0].establishment_name, "Chez Paul");
}

TEST_F(PayloadBuilderTest, SerializedPayloadNeverCarriesSecrets) {
    const auto text = serialize(builder.build(), true);
    EXPECT_EQ(text.find("sk-secret"), std::string::npos);
    EXPECT_EQ(text.find("ocrApiKey"), std::string::npos);
    EXPECT_EQ(text.find("\"photo\""), std::string::npos);

    const auto doc = json::parse(text);
    EXPECT_TRUE(doc.at("invoices")[0].at("images").empty());
}

TEST_F(PayloadBuilderTest, BuiltPayloadPassesValidation) {
    const auto payload = builder.build();
    for (const bool pretty : {true, false}) {
        const auto restored = validateBackupImportText(serialize(payload, pretty));
        ASSERT_TRUE(restored.has_value());
        EXPECT_EQ(restored->version, payload.version);
        EXPECT_EQ(restored->exported_at, payload.exported_at);
        EXPECT_EQ(restored->data, PayloadBuilder::stripForExport(sampleDataset()));
    }
}

TEST_F(PayloadBuilderTest, ImportedMarkupSurvivesAnotherExport) {
    auto doc = minimalDocument();
    doc["equipment"] = json::array({
        json{{"id", "eq-1"}, {"name", "<<i>b>Bob"}, {"type", "fridge"}, {"minTemp", 0}, {"maxTemp", 4}, {"order", 0}},
        json{{"id", "eq-2"}, {"name", "Frigo <<<i>i>b>2"}, {"type", "fridge"}, {"minTemp", 0}, {"maxTemp", 4}, {"order", 1}}
    });

    const auto imported = validateBackupImportPayload(doc);
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->data.equipment[0].name, "Bob");
    EXPECT_EQ(imported->data.equipment[1].name, "Frigo 2");

    PayloadBuilder again{std::make_shared<MemoryDataStore>(imported->data), clock.clock()};
    const auto reimported = validateBackupImportText(serialize(again.build(), true));
    ASSERT_TRUE(reimported.has_value());
    EXPECT_EQ(reimported->data, imported->data);

    PayloadBuilder third{std::make_shared<MemoryDataStore>(reimported->data), clock.clock()};
    EXPECT_EQ(serialize(third.build(), true), serialize(again.build(), true));
}

TEST_F(PayloadBuilderTest, RebuiltScriptTagEmptiesARequiredField) {
    auto doc = minimalDocument();
    doc["equipment"] = json::array({
        json{{"id", "eq-1"}, {"name", "<<i>script>Bob"}, {"type", "fridge"}, {"minTemp", 0}, {"maxTemp", 4}, {"order", 0}}
    });
    EXPECT_FALSE(validateBackupImportPayload(doc).has_value());
}

TEST_F(PayloadBuilderTest, PrettyOutputUsesTwoSpaceIndent) {
    const auto text = serialize(builder.build(), true);
    EXPECT_NE(text.find("\n  \"version\": 1"), std::string::npos);
    EXPECT_EQ(serialize(builder.build(), false).find('\n'), std::string::npos);
}

TEST_F(PayloadBuilderTest, EmptyStoreBuildsEmptyPayload) {
    PayloadBuilder empty{std::make_shared<MemoryDataStore>(), clock.clock()};
    const auto doc = json(empty.build());
    for (const auto c : ALL_COLLECTIONS) {
        ASSERT_TRUE(doc.contains(to_string(c)));
        EXPECT_TRUE(doc.at(to_string(c)).empty());
    }
}

TEST(PayloadBuilderCtorTest, RejectsMissingStore) {
    EXPECT_THROW(PayloadBuilder(nullptr), std::invalid_argument);
}
