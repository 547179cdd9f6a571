#include <format>

#include <spdlog/spdlog.h>

#include "event_guid.hpp"

namespace aptos::parse
{
    template<>
    Result<types::EventGuid> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_object())
        {
            spdlog::debug("parseFromJson<EventGuid> - not an object : {}", json_obj.dump());
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_OBJECT, "event guid must be an object"});
        }

        if(!json_obj.contains("creation_number"))
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_OBJECT, "missing creation_number"});

        if(!json_obj.contains("account_address"))
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_OBJECT, "missing account_address"});

        const json & creation_number_json = json_obj["creation_number"];
        if(!creation_number_json.is_string() && !creation_number_json.is_number())
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_OBJECT, "invalid creation_number"});

        const json & account_address_json = json_obj["account_address"];
        if(!account_address_json.is_string())
            return std::unexpected(ParseError{ParseError::Kind::MALFORMED_OBJECT, "invalid account_address"});

        auto creation_number = parseFromJson<types::U64>(creation_number_json, use_json);
        if(!creation_number)
        {
            spdlog::debug("parseFromJson<EventGuid> - creation_number : {}", creation_number.error().message);
            return std::unexpected(ParseError{creation_number.error().kind, std::format("creation_number: {}", creation_number.error().message)});
        }

        auto account_address = parseFromJson<types::AccountAddress>(account_address_json, use_json);
        if(!account_address)
        {
            spdlog::debug("parseFromJson<EventGuid> - account_address : {}", account_address.error().message);
            return std::unexpected(ParseError{account_address.error().kind, std::format("account_address: {}", account_address.error().message)});
        }

        return types::EventGuid{*creation_number, *account_address};
    }

    template<>
    json parseToJson(types::EventGuid guid, use_json_t)
    {
        json json_obj = json::object();
        json_obj["creation_number"] = parseToJson(guid.creation_number, use_json);
        json_obj["account_address"] = parseToJson(guid.account_address, use_json);
        return json_obj;
    }
}
