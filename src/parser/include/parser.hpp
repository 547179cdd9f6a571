#pragma once

#include <string>

#include <nlohmann/json.hpp>
// insertion ordered, so encoded objects keep their field order
using json = nlohmann::ordered_json;

#include "parse_error.hpp"

namespace aptos::parse
{   
    /**
     * @brief A tag type selecting the nlohmann::json codec.
     * 
     * Every wire type specialises parseFromJson / parseToJson for this tag.
     */
    struct use_json_t{};

    /**
     * @brief Tag value for use_json_t.
     */
    static constexpr use_json_t use_json{};

    /**
     * @brief Decodes a JSON value into a T.
     * 
     * @tparam T The value type.
     * @param json The JSON value to decode.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Encodes a T into its canonical JSON value.
     * 
     * Encoding is total over the value domain and therefore cannot fail.
     * 
     * @tparam T The value type.
     * @param value The value to encode.
     */
    template<class T>
    json parseToJson(T value, use_json_t);

    /**
     * @brief Decodes raw JSON text into a T.
     * 
     * Text that is not a JSON value at all fails with TYPE_MISMATCH.
     * 
     * @tparam T The value type.
     * @param json_str The raw JSON text.
     */
    template<class T>
    Result<T> parseFromJsonString(const std::string & json_str)
    {
        json json_obj = json::parse(json_str, nullptr, false);
        if(json_obj.is_discarded())
        {
            return std::unexpected(ParseError{ParseError::Kind::TYPE_MISMATCH, "invalid json: " + json_str});
        }
        return parseFromJson<T>(std::move(json_obj), use_json);
    }

    /**
     * @brief Encodes a T into compact canonical JSON text.
     * 
     * @tparam T The value type.
     * @param value The value to encode.
     */
    template<class T>
    std::string parseToJsonString(T value)
    {
        return parseToJson(std::move(value), use_json).dump();
    }
}
