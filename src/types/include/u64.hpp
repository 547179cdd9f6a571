#pragma once

#include <compare>
#include <cstdint>
#include <utility>

#include <absl/hash/hash.h>

#include "parser.hpp"

namespace aptos::types
{
    /**
     * @brief A uint64 that travels over JSON as either a number or a string.
     * 
     * Decoding accepts both "123" and 123, encoding always produces the
     * quoted form so consumers limited to double precision keep every bit.
     */
    class U64
    {
        public:
            U64() = default;

            constexpr explicit U64(std::uint64_t value) : _value(value) {}

            /**
             * @brief Returns the raw integer.
             * 
             * Every U64 holds a valid uint64: it is built either from a
             * uint64 or by parseFromJson, which rejects anything outside
             * [0, 2^64 - 1]. No further check is needed here.
             */
            constexpr std::uint64_t toUint64() const { return _value; }

            bool operator==(const U64 &) const = default;
            auto operator<=>(const U64 &) const = default;

        private:
            std::uint64_t _value = 0;
    };

    template <typename H>
    inline H AbslHashValue(H h, const U64 & v) {
        return H::combine(std::move(h), v.toUint64());
    }
}

namespace aptos::parse
{
    /**
     * @brief Decodes a U64 from a JSON string or a bare JSON number.
     * @param json_obj The JSON value to decode.
     */
    template<>
    Result<types::U64> parseFromJson(json json_obj, use_json_t);

    /**
     * @brief Encodes a U64 as a quoted decimal string.
     * @param value The value to encode.
     */
    template<>
    json parseToJson(types::U64 value, use_json_t);
}
