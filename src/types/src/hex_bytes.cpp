#include <format>

#include <spdlog/spdlog.h>

#include "hex_bytes.hpp"
#include "hex.hpp"
#include "base64.hpp"

namespace aptos::types
{
    std::optional<std::vector<std::uint8_t>> decodeHexOrBase64(const std::string & str)
    {
        if(str.empty())
        {
            return std::nullopt;
        }

        if(utils::hasHexPrefix(str))
        {
            return utils::parseHex(str);
        }

        if(str.back() == '=')
        {
            return utils::decodeBase64(str);
        }

        if(auto bytes = utils::parseHex(str))
        {
            return bytes;
        }
        return utils::decodeBase64(str);
    }
}

namespace aptos::parse
{
    template<>
    Result<types::HexBytes> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_string())
        {
            spdlog::debug("parseFromJson<HexBytes> - not a string : {}", json_obj.dump());
            return std::unexpected(ParseError{ParseError::Kind::TYPE_MISMATCH, "bytes must be a string"});
        }

        const std::string str = json_obj.get<std::string>();
        auto bytes = types::decodeHexOrBase64(str);
        if(!bytes)
        {
            spdlog::debug("parseFromJson<HexBytes> - neither hex nor base64 : {}", str);
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_BYTES, std::format("'{}' is neither valid hex nor valid base64", str)});
        }

        return types::HexBytes{std::move(*bytes)};
    }

    template<>
    json parseToJson(types::HexBytes value, use_json_t)
    {
        return utils::bytesToHex(value.bytes);
    }
}
