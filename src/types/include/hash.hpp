#pragma once

#include <string>
#include <utility>

#include <absl/hash/hash.h>

#include "parser.hpp"

namespace aptos::types
{
    /**
     * @brief A 32-byte hash as hex text.
     * 
     * Expected to hold 64 lowercase hex digits, optionally "0x" prefixed:
     * 
     *     0xf4d07fdb8b5151971886a910e516d418a790dd5f6e068b0588066518a395a600
     * 
     * The content is not checked. Values are passed through as received.
     */
    class Hash
    {
        public:
            Hash() = default;

            explicit Hash(std::string value) : _value(std::move(value)) {}

            const std::string & str() const { return _value; }

            bool operator==(const Hash &) const = default;

        private:
            // TODO: decide whether this should be a fixed 32-byte array instead of text
            std::string _value;
    };

    template <typename H>
    inline H AbslHashValue(H h, const Hash & hash) {
        return H::combine(std::move(h), hash.str());
    }
}

namespace aptos::parse
{
    template<>
    Result<types::Hash> parseFromJson(json json_obj, use_json_t);

    template<>
    json parseToJson(types::Hash hash, use_json_t);
}
