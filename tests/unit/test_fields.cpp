#include <gtest/gtest.h>
#include "backup/fields.hpp"
#include "types/Equipment.hpp"

#include <limits>

using namespace cuisine::backup::fields;
using namespace cuisine::types;
using nlohmann::json;

TEST(FieldsTest, StringIsSanitizedAndTrimmed) {
    EXPECT_EQ(toString(json("  <b>Frigo</b> 1 ")), "Frigo 1");
    EXPECT_EQ(toString(json("Ã‰tagÃ¨re")), "Étagère");
}

TEST(FieldsTest, StringRejectsEmptyAndNonStrings) {
    EXPECT_FALSE(toString(json("   ")).has_value());
    EXPECT_FALSE(toString(json("<script>x</script>")).has_value());
    EXPECT_FALSE(toString(json(42)).has_value());
    EXPECT_FALSE(toString(json(nullptr)).has_value());
    EXPECT_FALSE(toString(json::array({"a"})).has_value());
}

TEST(FieldsTest, StringArrayDropsBadEntriesAndDeduplicates) {
    const auto tags = toStringArray(json::array({"lait", " lait ", 3, "", "œufs", nullptr, "lait"}));
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0], "lait");
    EXPECT_EQ(tags[1], "œufs");
}

TEST(FieldsTest, StringArrayOfNonArrayIsEmpty) {
    EXPECT_TRUE(toStringArray(json("lait")).empty());
    EXPECT_TRUE(toStringArray(json(nullptr)).empty());
}

TEST(FieldsTest, NumberAcceptsNumbersAndNumericStrings) {
    EXPECT_EQ(toNumber(json(3.5)), 3.5);
    EXPECT_EQ(toNumber(json(-18)), -18.0);
    EXPECT_EQ(toNumber(json("4.25")), 4.25);
    EXPECT_EQ(toNumber(json("  12 ")), 12.0);
    EXPECT_EQ(toNumber(json("-1e3")), -1000.0);
    EXPECT_EQ(toNumber(json(".5")), 0.5);
    EXPECT_EQ(toNumber(json("+7")), 7.0);
    EXPECT_EQ(toNumber(json("0x1F")), 31.0);
    EXPECT_EQ(toNumber(json("0b101")), 5.0);
    EXPECT_EQ(toNumber(json("0o17")), 15.0);
}

TEST(FieldsTest, NumberRejectsNonFiniteAndMalformed) {
    EXPECT_FALSE(toNumber(json("")).has_value());
    EXPECT_FALSE(toNumber(json("   ")).has_value());
    EXPECT_FALSE(toNumber(json("Infinity")).has_value());
    EXPECT_FALSE(toNumber(json("NaN")).has_value());
    EXPECT_FALSE(toNumber(json("1e400")).has_value());
    EXPECT_FALSE(toNumber(json("12abc")).has_value());
    EXPECT_FALSE(toNumber(json("1,5")).has_value());
    EXPECT_FALSE(toNumber(json("-0x10")).has_value());
    EXPECT_FALSE(toNumber(json("0x")).has_value());
    EXPECT_FALSE(toNumber(json(std::numeric_limits<double>::quiet_NaN())).has_value());
    EXPECT_FALSE(toNumber(json(std::numeric_limits<double>::infinity())).has_value());
}

TEST(FieldsTest, BooleansAreNotNumbers) {
    EXPECT_FALSE(toNumber(json(true)).has_value());
    EXPECT_FALSE(toNumber(json(nullptr)).has_value());
}

TEST(FieldsTest, RoundedIntegerRoundsHalfUp) {
    EXPECT_EQ(toRoundedInteger(json(2.5)), 3);
    EXPECT_EQ(toRoundedInteger(json(-2.5)), -2);
    EXPECT_EQ(toRoundedInteger(json("4.4")), 4);
    EXPECT_FALSE(toRoundedInteger(json(1e300)).has_value());
}

TEST(FieldsTest, BooleanAcceptsOnlyLiterals) {
    EXPECT_EQ(toBoolean(json(true)), true);
    EXPECT_EQ(toBoolean(json(false)), false);
    EXPECT_FALSE(toBoolean(json(1)).has_value());
    EXPECT_FALSE(toBoolean(json("true")).has_value());
    EXPECT_FALSE(toBoolean(json(nullptr)).has_value());
}

TEST(FieldsTest, DateAcceptsIsoStringsAndEpochNumbers) {
    const auto fromString = toDate(json("2024-03-01T08:00:00.000Z"));
    const auto fromNumber = toDate(json(1709280000000));
    ASSERT_TRUE(fromString.has_value());
    ASSERT_TRUE(fromNumber.has_value());
    EXPECT_EQ(*fromString, *fromNumber);
}

TEST(FieldsTest, DateRejectsUnparseable) {
    EXPECT_FALSE(toDate(json("yesterday")).has_value());
    EXPECT_FALSE(toDate(json("2024-02-30")).has_value());
    EXPECT_FALSE(toDate(json(1e20)).has_value());
    EXPECT_FALSE(toDate(json(true)).has_value());
    EXPECT_FALSE(toDate(json(nullptr)).has_value());
}

TEST(FieldsTest, EnumRequiresExactTag) {
    EXPECT_EQ(toEnum<EquipmentType>(json("cold_room"), equipment_type_from_string), EquipmentType::ColdRoom);
    EXPECT_FALSE(toEnum<EquipmentType>(json("Fridge"), equipment_type_from_string).has_value());
    EXPECT_FALSE(toEnum<EquipmentType>(json(" fridge"), equipment_type_from_string).has_value());
    EXPECT_FALSE(toEnum<EquipmentType>(json("walk_in"), equipment_type_from_string).has_value());
    EXPECT_FALSE(toEnum<EquipmentType>(json(0), equipment_type_from_string).has_value());
}
