#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace ris;

TEST(RoundTripTests, LoadThenDumpIsByteExact) {
    EXPECT_EQ(dumps(loads(EXAMPLE_FULL_RIS)), EXAMPLE_FULL_RIS);
}

TEST(RoundTripTests, UnknownTagsStayInPlace) {
    const std::string text =
        "1.\n"
        "TY  - JOUR\n"
        "AU  - Shannon,Claude E.\n"
        "JP  - CRISPR\n"
        "DC  - Direct Current\n"
        "PY  - 1948/07//\n"
        "ER  - \n";
    EXPECT_EQ(dumps(loads(text)), text);
}

TEST(RoundTripTests, EmptyUrlLine) {
    const std::string text =
        "1.\n"
        "TY  - JOUR\n"
        "UR  - \n"
        "ER  - \n";
    EXPECT_EQ(dumps(loads(text)), text);
}

TEST(RoundTripTests, LiteralUnknownTag) {
    const std::string text =
        "1.\n"
        "TY  - JOUR\n"
        "UK  - kept\n"
        "JP  - CRISPR\n"
        "ER  - \n";
    EXPECT_EQ(dumps(loads(text)), text);
}

TEST(RoundTripTests, CustomListTags) {
    const std::string text =
        "1.\n"
        "TY  - JOUR\n"
        "AU  - Marx, Karl\n"
        "AU  - Marxus, Karlus\n"
        "SN  - 12345\n"
        "SN  - ABCDEFG\n"
        "SN  - 666666\n"
        "ER  - \n";
    TagSet listTags = defaultListTags(Dialect::RIS);
    listTags.insert("SN");

    ParserOptions parseOptions;
    parseOptions.tags.listTags = listTags;
    WriterOptions writeOptions;
    writeOptions.tags.listTags = listTags;

    EXPECT_EQ(dumps(loads(text, parseOptions), writeOptions), text);
}

TEST(RoundTripTests, DelimitedTags) {
    const std::string text =
        "1.\n"
        "TY  - JOUR\n"
        "KW  - alpha;beta;gamma\n"
        "ER  - \n";
    ParserOptions parseOptions;
    parseOptions.tags.delimiters = DelimiterMap{{"KW", ";"}};
    WriterOptions writeOptions;
    writeOptions.tags.delimiters = DelimiterMap{{"KW", ";"}};

    const auto records = loads(text, parseOptions);
    EXPECT_EQ(*records[0].list("keywords"), (ValueList{"alpha", "beta", "gamma"}));
    EXPECT_EQ(dumps(records, writeOptions), text);
}

TEST(RoundTripTests, ReparseIsIdempotent) {
    for (const std::string& text : {SHANNON_RIS, MULTILINE_RIS, EXAMPLE_FULL_RIS}) {
        const auto first = loads(text);
        EXPECT_EQ(loads(dumps(first)), first);
    }
}

TEST(RoundTripTests, ReparseWithRelaxedLists) {
    ParserOptions parseOptions;
    parseOptions.enforceListTags = false;
    WriterOptions writeOptions;
    writeOptions.enforceListTags = false;

    const auto first = loads("TY  - JOUR\nTI  - one\nTI  - two\nPY  - 2000\nER  - \n", parseOptions);
    EXPECT_EQ(loads(dumps(first, writeOptions), parseOptions), first);
}

TEST(RoundTripTests, ByteOrderMarkDoesNotChangeOutput) {
    EXPECT_EQ(dumps(loads("\xEF\xBB\xBF" + EXAMPLE_FULL_RIS)), EXAMPLE_FULL_RIS);
}

TEST(RoundTripTests, WokReparseIsIdempotent) {
    ParserOptions parseOptions;
    parseOptions.dialect = Dialect::WOK;
    WriterOptions writeOptions;
    writeOptions.dialect = Dialect::WOK;

    const auto first = loads(WOK_SAMPLE, parseOptions);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(loads(dumps(first, writeOptions), parseOptions), first);
}

TEST(RoundTripTests, MedlineReparseIsIdempotent) {
    ParserOptions parseOptions;
    parseOptions.dialect = Dialect::MEDLINE;
    WriterOptions writeOptions;
    writeOptions.dialect = Dialect::MEDLINE;

    const auto first = loads(MEDLINE_SAMPLE, parseOptions);
    ASSERT_EQ(first.size(), 2u);
    const std::string text = dumps(first, writeOptions);
    EXPECT_NE(text.find("XYZ - mystery"), std::string::npos);
    EXPECT_EQ(loads(text, parseOptions), first);
}

TEST(RoundTripTests, WokEmptyListElementSurvives) {
    ParserOptions parseOptions;
    parseOptions.dialect = Dialect::WOK;
    WriterOptions writeOptions;
    writeOptions.dialect = Dialect::WOK;

    const std::vector<Record> records{Record{
        {"publication_type", "J"},
        {"authors", ValueList{"A", "", "B"}},
    }};
    const std::string text = dumps(records, writeOptions);
    EXPECT_NE(text.find("\nAU \n"), std::string::npos);
    EXPECT_EQ(loads(text, parseOptions), records);
}
