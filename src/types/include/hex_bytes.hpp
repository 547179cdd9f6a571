#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/hash/hash.h>

#include "parser.hpp"

namespace aptos::types
{
    /**
     * @brief Bytes that arrive as hex or base64 and always leave as hex.
     * 
     * Example:
     * 
     *     "0x123456" -> {0x12, 0x34, 0x56}
     *     "EjRW"     -> {0x12, 0x34, 0x56}
     *     {0x12, 0x34, 0x56} -> "0x123456"
     */
    struct HexBytes
    {
        std::vector<std::uint8_t> bytes;

        bool operator==(const HexBytes &) const = default;
    };

    template <typename H>
    inline H AbslHashValue(H h, const HexBytes & b) {
        return H::combine(std::move(h), b.bytes);
    }

    /**
     * @brief Decodes the content of a wire string.
     * 
     * Format is picked in this order, which decides how ambiguous input like
     * "abcd" is read:
     *   1. "0x" prefix        -> hex
     *   2. '=' suffix         -> base64
     *   3. otherwise          -> hex, then base64 if hex fails
     * 
     * @return The bytes or std::nullopt when no applicable format matches.
     */
    std::optional<std::vector<std::uint8_t>> decodeHexOrBase64(const std::string & str);
}

namespace aptos::parse
{
    /**
     * @brief Decodes a JSON string holding hex or base64 encoded bytes.
     * @param json_obj The JSON value to decode.
     */
    template<>
    Result<types::HexBytes> parseFromJson(json json_obj, use_json_t);

    /**
     * @brief Encodes bytes as a "0x" prefixed lowercase hex string.
     * @param value The bytes to encode.
     */
    template<>
    json parseToJson(types::HexBytes value, use_json_t);
}
