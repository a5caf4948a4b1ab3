#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace ris;

namespace {

std::filesystem::path tempFile(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

void writeBytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary);
    file << bytes;
}

} // namespace

TEST(RisTests, LoadFromStream) {
    std::istringstream in(SHANNON_RIS);
    const auto records = load(in);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], shannonRecord());
}

TEST(RisTests, LoadFromPath) {
    const auto path = tempFile("ris_load_from_path.ris");
    writeBytes(path, EXAMPLE_FULL_RIS);

    const auto records = load(path);
    EXPECT_EQ(records.size(), 2u);
    std::filesystem::remove(path);
}

TEST(RisTests, LoadLatin1File) {
    const auto path = tempFile("ris_latin1.ris");
    writeBytes(path, "TY  - JOUR\nTI  - Caf\xE9\nER  - \n");

    const auto records = load(path, "latin-1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(*records[0].scalar("title"), "Caf\xC3\xA9");
    std::filesystem::remove(path);
}

TEST(RisTests, UnsupportedEncoding) {
    EXPECT_THROW(decode("TY  - JOUR\n", "ebcdic"), ConfigurationError);
    EXPECT_EQ(decode("plain", "UTF-8"), "plain");
}

TEST(RisTests, MissingFile) {
    EXPECT_THROW(load(tempFile("ris_does_not_exist.ris")), std::runtime_error);
}

TEST(RisTests, DumpToPathAndLoadBack) {
    const auto path = tempFile("ris_dump_and_load.ris");
    const auto records = loads(EXAMPLE_FULL_RIS);

    dump(records, path);
    EXPECT_EQ(load(path), records);

    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_EQ(buffer.str(), EXAMPLE_FULL_RIS);
    file.close();
    std::filesystem::remove(path);
}

TEST(RisTests, OptionsArePassedThrough) {
    ParserOptions options;
    options.dialect = Dialect::WOK;
    std::istringstream in(WOK_SAMPLE);
    EXPECT_EQ(load(in, options).size(), 2u);
}
