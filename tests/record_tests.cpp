#include <gtest/gtest.h>
#include "../src/record.hpp"
#include <stdexcept>
#include <string>

using ris::Record;
using ris::UnknownTags;
using ris::ValueList;

TEST(RecordTests, KeepsInsertionOrder) {
    Record record;
    record.set("title", "Second");
    record.set("authors", ValueList{"Doe, J"});
    record.set("year", "2001");

    std::vector<std::string> names;
    for (const auto& [name, value] : record) {
        names.push_back(name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"title", "authors", "year"}));
}

TEST(RecordTests, SetReplacesInPlace) {
    Record record{{"title", "a"}, {"year", "1999"}};
    record.set("title", ValueList{"a", "b"});

    ASSERT_EQ(record.size(), 2u);
    EXPECT_EQ(record.begin()->first, "title");
    ASSERT_NE(record.list("title"), nullptr);
    EXPECT_EQ(*record.list("title"), (ValueList{"a", "b"}));
    EXPECT_EQ(record.scalar("title"), nullptr);
}

TEST(RecordTests, TypedLookups) {
    Record record{
        {"title", "T"},
        {"authors", ValueList{"A"}},
        {"unknown_tag", UnknownTags{{"JP", {"CRISPR"}}}},
    };

    ASSERT_NE(record.scalar("title"), nullptr);
    EXPECT_EQ(*record.scalar("title"), "T");
    EXPECT_EQ(record.list("title"), nullptr);
    ASSERT_NE(record.unknownTags("unknown_tag"), nullptr);
    EXPECT_EQ(*record.unknownTags("unknown_tag")->find("JP"), ValueList{"CRISPR"});
    EXPECT_EQ(record.scalar("missing"), nullptr);
    EXPECT_THROW(record.at("missing"), std::out_of_range);
}

TEST(RecordTests, EqualityIgnoresFieldOrder) {
    Record a{{"title", "T"}, {"year", "2000"}};
    Record b{{"year", "2000"}, {"title", "T"}};
    Record c{{"year", "2000"}, {"title", ValueList{"T"}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, (Record{{"title", "T"}}));
}

TEST(RecordTests, EraseField) {
    Record record{{"title", "T"}, {"year", "2000"}};
    EXPECT_TRUE(record.erase("title"));
    EXPECT_FALSE(record.erase("title"));
    EXPECT_FALSE(record.contains("title"));
    EXPECT_EQ(record.size(), 1u);
}

TEST(UnknownTagsTests, AppendGroupsByTag) {
    UnknownTags unknown;
    unknown.append("JP", "CRISPR");
    unknown.append("DC", "Direct Current");
    unknown.append("JP", "PEOPLE");

    ASSERT_EQ(unknown.size(), 2u);
    EXPECT_EQ(unknown.begin()->first, "JP");
    EXPECT_EQ(*unknown.find("JP"), (ValueList{"CRISPR", "PEOPLE"}));
    EXPECT_EQ(*unknown.find("DC"), ValueList{"Direct Current"});
    EXPECT_EQ(unknown.find("XX"), nullptr);
}

TEST(UnknownTagsTests, EqualityIsMappingEquality) {
    UnknownTags a{{"JP", {"CRISPR"}}, {"DC", {"Direct Current"}}};
    UnknownTags b{{"DC", {"Direct Current"}}, {"JP", {"CRISPR"}}};
    UnknownTags c{{"JP", {"CRISPR", "PEOPLE"}}, {"DC", {"Direct Current"}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(RecordTests, ToStringShowsEveryKind) {
    Record record{
        {"title", "T"},
        {"authors", ValueList{"A", "B"}},
        {"unknown_tag", UnknownTags{{"JP", {"CRISPR"}}}},
    };
    EXPECT_EQ(record.to_string(), "{title: \"T\", authors: [\"A\", \"B\"], unknown_tag: {JP: [\"CRISPR\"]}}");
}
