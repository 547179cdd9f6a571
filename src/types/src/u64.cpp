#include <format>

#include <spdlog/spdlog.h>

#include "u64.hpp"
#include "math.hpp"

namespace aptos::parse
{
    template<>
    Result<types::U64> parseFromJson(json json_obj, use_json_t)
    {
        // a quoted token carries the literal inside the quotes, any other token is the literal itself
        const std::string literal = json_obj.is_string() ? json_obj.get<std::string>() : json_obj.dump();

        // signed tokens like "-0" dump without their sign, so only unsigned numbers reach the parser
        const bool digits_only = json_obj.is_string() || json_obj.is_number_unsigned();

        const auto value = digits_only ? utils::strToUint64(literal) : std::nullopt;
        if(!value)
        {
            spdlog::debug("parseFromJson<U64> - invalid literal : {}", literal);
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_NUMBER, std::format("invalid uint64 literal '{}'", literal)});
        }

        return types::U64{*value};
    }

    template<>
    json parseToJson(types::U64 value, use_json_t)
    {
        return std::to_string(value.toUint64());
    }
}
