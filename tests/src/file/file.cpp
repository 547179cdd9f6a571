#include "unit-tests.hpp"

#include <filesystem>
#include <fstream>

using namespace aptos;
using namespace aptos::tests;

TEST_F(UnitTest, File_LoadTextFile_ReadsInput)
{
    const auto dir = std::filesystem::temp_directory_path() / "aptos-json-file-test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "guid.json";
    {
        std::ofstream out(path);
        out << R"({"creation_number": "3", "account_address": "0x1"})";
    }

    auto content = file::loadTextFile(path);
    ASSERT_TRUE(content.has_value());

    auto guid = parse::parseFromJsonString<types::EventGuid>(*content);
    ASSERT_TRUE(guid.has_value());
    EXPECT_EQ(guid->creation_number.toUint64(), 3U);

    std::filesystem::remove_all(dir);
}

TEST_F(UnitTest, File_LoadTextFile_RejectsMissingAndDirectories)
{
    const auto dir = std::filesystem::temp_directory_path() / "aptos-json-dir-test";
    std::filesystem::create_directories(dir);

    EXPECT_FALSE(file::loadTextFile(dir / "missing.json").has_value());
    EXPECT_FALSE(file::loadTextFile(dir).has_value());

    std::filesystem::remove_all(dir);
}
