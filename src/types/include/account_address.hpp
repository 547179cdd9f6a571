#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <absl/hash/hash.h>

#include <evmc/evmc.hpp>

#include "parser.hpp"

namespace aptos::types
{
    /**
     * @brief A 32-byte account address.
     * 
     * Addresses 0x0 through 0xf are "special" and print in short form,
     * every other address prints all 64 hex digits.
     */
    struct AccountAddress
    {
        evmc::bytes32 bytes{};

        bool operator==(const AccountAddress &) const = default;

        bool isSpecial() const;

        std::string toString() const;
    };

    /**
     * @brief Parses an address in relaxed form.
     * 
     * Accepts an optional "0x" prefix followed by 1 to 64 hex digits. Shorter
     * input is left padded with zeros, so "0x1" is the core framework address.
     */
    std::optional<AccountAddress> parseAccountAddress(std::string_view str);

    template <typename H>
    inline H AbslHashValue(H h, const AccountAddress & a) {
        return H::combine_contiguous(std::move(h), a.bytes.bytes, sizeof(a.bytes.bytes));
    }
}

namespace aptos::parse
{
    /**
     * @brief Decodes a JSON string holding an account address.
     * @param json_obj The JSON value to decode.
     */
    template<>
    Result<types::AccountAddress> parseFromJson(json json_obj, use_json_t);

    /**
     * @brief Encodes an account address as its string form.
     * @param address The address to encode.
     */
    template<>
    json parseToJson(types::AccountAddress address, use_json_t);
}
