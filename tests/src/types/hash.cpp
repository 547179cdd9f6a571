#include "unit-tests.hpp"

using namespace aptos;
using namespace aptos::parse;
using namespace aptos::types;
using namespace aptos::tests;

TEST_F(UnitTest, Hash_ParseFromJson_PassThrough)
{
    const std::string hash_str = "0xf4d07fdb8b5151971886a910e516d418a790dd5f6e068b0588066518a395a600";

    auto hash = parseFromJson<Hash>(json(hash_str), use_json);

    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->str(), hash_str);
    EXPECT_EQ(parseToJson(*hash, use_json).get<std::string>(), hash_str);
}

TEST_F(UnitTest, Hash_ParseFromJson_DoesNotValidateContent)
{
    auto hash = parseFromJson<Hash>(json("not a hash"), use_json);

    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->str(), "not a hash");
}

TEST_F(UnitTest, Hash_ParseFromJson_NotAString)
{
    auto hash = parseFromJson<Hash>(json(32), use_json);

    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().kind, ParseError::Kind::TYPE_MISMATCH);
}
