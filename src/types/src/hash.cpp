#include <spdlog/spdlog.h>

#include "hash.hpp"

namespace aptos::parse
{
    template<>
    Result<types::Hash> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_string())
        {
            spdlog::debug("parseFromJson<Hash> - not a string : {}", json_obj.dump());
            return std::unexpected(ParseError{ParseError::Kind::TYPE_MISMATCH, "hash must be a string"});
        }
        return types::Hash{json_obj.get<std::string>()};
    }

    template<>
    json parseToJson(types::Hash hash, use_json_t)
    {
        return hash.str();
    }
}
