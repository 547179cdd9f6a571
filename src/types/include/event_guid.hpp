#pragma once

#include <utility>

#include <absl/hash/hash.h>

#include "parser.hpp"
#include "u64.hpp"
#include "account_address.hpp"

namespace aptos::types
{
    /**
     * @brief GUID of a V1 event: the creator account and its creation number.
     * 
     * Wire form:
     * 
     *     {"creation_number": "5", "account_address": "0x1"}
     * 
     * Only valid for the `guid` of entries in a transaction's `events`. The
     * `GUID` resource found in write-set `changes` has a different shape and
     * must not be decoded with this type.
     */
    struct EventGuid
    {
        U64 creation_number{};
        AccountAddress account_address{};

        bool operator==(const EventGuid &) const = default;
    };

    template <typename H>
    inline H AbslHashValue(H h, const EventGuid & g) {
        return H::combine(std::move(h), g.creation_number, g.account_address);
    }
}

namespace aptos::parse
{
    /**
     * @brief Decodes an event GUID object.
     * 
     * Both fields are required. Unknown fields are ignored.
     * 
     * @param json_obj The JSON object to decode.
     */
    template<>
    Result<types::EventGuid> parseFromJson(json json_obj, use_json_t);

    /**
     * @brief Encodes an event GUID.
     * 
     * Fields are emitted creation_number first, then account_address.
     * @param guid The GUID to encode.
     */
    template<>
    json parseToJson(types::EventGuid guid, use_json_t);
}
