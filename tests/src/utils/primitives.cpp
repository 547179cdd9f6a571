#include "unit-tests.hpp"

#include <cstdint>
#include <format>
#include <vector>

#include "hex.hpp"
#include "base64.hpp"
#include "math.hpp"

using namespace aptos;
using namespace aptos::tests;

TEST_F(UnitTest, Utils_StrToUint64)
{
    EXPECT_EQ(utils::strToUint64("0"), std::optional<std::uint64_t>{0});
    EXPECT_EQ(utils::strToUint64("007"), std::optional<std::uint64_t>{7});
    EXPECT_EQ(utils::strToUint64("18446744073709551615"), std::optional<std::uint64_t>{18446744073709551615ULL});

    EXPECT_FALSE(utils::strToUint64("").has_value());
    EXPECT_FALSE(utils::strToUint64("18446744073709551616").has_value());
    EXPECT_FALSE(utils::strToUint64("\t1").has_value());
    EXPECT_FALSE(utils::strToUint64("-0").has_value());
}

TEST_F(UnitTest, Utils_ParseHex)
{
    EXPECT_EQ(utils::parseHex("0x00ff"), (std::optional<std::vector<std::uint8_t>>{{0x00, 0xff}}));
    EXPECT_EQ(utils::parseHex("00ff"), (std::optional<std::vector<std::uint8_t>>{{0x00, 0xff}}));
    EXPECT_EQ(utils::parseHex("0x"), (std::optional<std::vector<std::uint8_t>>{std::vector<std::uint8_t>{}}));
    EXPECT_FALSE(utils::parseHex("0x0").has_value());
    EXPECT_FALSE(utils::parseHex("0xgg").has_value());
}

TEST_F(UnitTest, Utils_BytesToHex)
{
    EXPECT_EQ(utils::bytesToHex(std::vector<std::uint8_t>{}), "0x");
    EXPECT_EQ(utils::bytesToHex(std::vector<std::uint8_t>{0x0a, 0xbc}), "0x0abc");
}

TEST_F(UnitTest, Utils_Base64)
{
    EXPECT_EQ(utils::decodeBase64("EjRW"), (std::optional<std::vector<std::uint8_t>>{{0x12, 0x34, 0x56}}));
    EXPECT_EQ(utils::decodeBase64("Eg=="), (std::optional<std::vector<std::uint8_t>>{{0x12}}));
    EXPECT_EQ(utils::encodeBase64({0x12}), "Eg==");
    EXPECT_FALSE(utils::decodeBase64("Eg").has_value());
    EXPECT_FALSE(utils::decodeBase64("E-g=").has_value());
}

TEST_F(UnitTest, ParseError_KindFormatting)
{
    EXPECT_EQ(std::format("{}", parse::ParseError::Kind::MALFORMED_NUMBER), "Malformed number");
    EXPECT_EQ(std::format("{}", parse::ParseError::Kind::MALFORMED_BYTES), "Malformed bytes");
    EXPECT_EQ(std::format("{}", parse::ParseError::Kind::MALFORMED_OBJECT), "Malformed object");
}

TEST_F(UnitTest, Parser_ParseFromJsonString_InvalidJson)
{
    auto result = parse::parseFromJsonString<types::U64>("{not json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, parse::ParseError::Kind::TYPE_MISMATCH);
}
