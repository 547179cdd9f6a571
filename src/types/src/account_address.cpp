#include <algorithm>
#include <cctype>
#include <format>

#include <spdlog/spdlog.h>
#include <evmc/hex.hpp>

#include "account_address.hpp"
#include "hex.hpp"

namespace aptos::types
{
    bool AccountAddress::isSpecial() const
    {
        constexpr std::size_t last = sizeof(bytes.bytes) - 1;
        const bool leading_zero = std::all_of(bytes.bytes, bytes.bytes + last, [](std::uint8_t b) { return b == 0; });
        return leading_zero && bytes.bytes[last] < 0x10;
    }

    std::string AccountAddress::toString() const
    {
        if(isSpecial())
        {
            return std::format("0x{:x}", bytes.bytes[sizeof(bytes.bytes) - 1]);
        }
        return utils::bytesToHex(bytes.bytes, sizeof(bytes.bytes));
    }

    std::optional<AccountAddress> parseAccountAddress(std::string_view str)
    {
        if(utils::hasHexPrefix(str))
        {
            str.remove_prefix(2);
        }

        if(str.empty() || str.size() > 2 * sizeof(evmc::bytes32::bytes))
        {
            return std::nullopt;
        }

        // evmc::from_hex strips its own "0x", which would accept "0x0x12" or "x12"
        if(!std::ranges::all_of(str, [](unsigned char c) { return std::isxdigit(c) != 0; }))
        {
            return std::nullopt;
        }

        // evmc::from_hex needs an even digit count
        std::string digits;
        if(str.size() % 2 == 1)
        {
            digits.push_back('0');
        }
        digits.append(str);

        const auto value = evmc::from_hex<evmc::bytes32>(digits);
        if(!value)
        {
            return std::nullopt;
        }
        return AccountAddress{*value};
    }
}

namespace aptos::parse
{
    template<>
    Result<types::AccountAddress> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_string())
        {
            spdlog::debug("parseFromJson<AccountAddress> - not a string : {}", json_obj.dump());
            return std::unexpected(ParseError{ParseError::Kind::TYPE_MISMATCH, "account address must be a string"});
        }

        const std::string str = json_obj.get<std::string>();
        const auto address = types::parseAccountAddress(str);
        if(!address)
        {
            spdlog::debug("parseFromJson<AccountAddress> - invalid address : {}", str);
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_ADDRESS, std::format("invalid account address '{}'", str)});
        }
        return *address;
    }

    template<>
    json parseToJson(types::AccountAddress address, use_json_t)
    {
        return address.toString();
    }
}
