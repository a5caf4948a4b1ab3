#include <gtest/gtest.h>
#include "../src/reference_types.hpp"
#include <stdexcept>
#include <vector>

using namespace ris;

namespace {

std::vector<Record> typed(std::initializer_list<const char*> types) {
    std::vector<Record> records;
    for (const char* type : types) {
        records.push_back(Record{{"type_of_reference", type}, {"title", "T"}});
    }
    return records;
}

} // namespace

TEST(ReferenceTypesTests, ConvertsCodesToNames) {
    const auto original = typed({"JOUR", "BOOK"});
    const auto converted = convertReferenceTypes(original);

    EXPECT_EQ(*converted[0].scalar("type_of_reference"), "Journal");
    EXPECT_EQ(*converted[1].scalar("type_of_reference"), "Whole book");
    EXPECT_EQ(*original[0].scalar("type_of_reference"), "JOUR");
}

TEST(ReferenceTypesTests, ConvertsNamesBackToCodes) {
    const auto converted = convertReferenceTypes(typed({"Journal", "Thesis/Dissertation"}), true);
    EXPECT_EQ(*converted[0].scalar("type_of_reference"), "JOUR");
    EXPECT_EQ(*converted[1].scalar("type_of_reference"), "THES");
}

TEST(ReferenceTypesTests, UnknownTypeIsKeptUnlessStrict) {
    EXPECT_EQ(*convertReferenceTypes(typed({"XXXX"}))[0].scalar("type_of_reference"), "XXXX");

    try {
        convertReferenceTypes(typed({"XXXX"}), false, true);
        FAIL() << "Expected std::out_of_range";
    } catch (const std::out_of_range& e) {
        EXPECT_STREQ(e.what(), "Type \"XXXX\" not found.");
    }
}

TEST(ReferenceTypesTests, StrictAcceptsAlreadyConvertedTypes) {
    const auto converted = convertReferenceTypes(typed({"Journal"}), false, true);
    EXPECT_EQ(*converted[0].scalar("type_of_reference"), "Journal");
}

TEST(ReferenceTypesTests, CustomTypeMap) {
    const Mapping typeMap{{"JOUR", "Article"}};
    const auto converted = convertReferenceTypes(typed({"JOUR"}), false, false, typeMap);
    EXPECT_EQ(*converted[0].scalar("type_of_reference"), "Article");
}

TEST(ReferenceTypesTests, RecordsWithoutTypeAreUntouched) {
    const std::vector<Record> records{Record{{"title", "T"}}};
    EXPECT_EQ(convertReferenceTypes(records, false, true), records);
}
