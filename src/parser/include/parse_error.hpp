#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace aptos::parse
{   
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN             = 0U,

            MALFORMED_NUMBER    = 1U,
            MALFORMED_BYTES     = 2U,
            MALFORMED_OBJECT    = 3U,
            MALFORMED_ADDRESS   = 4U,
            TYPE_MISMATCH       = 5U
        };
        
        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    using ParseError = Error;

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<aptos::parse::Error::Kind> : std::formatter<std::string> {
    auto format(const aptos::parse::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case aptos::parse::Error::Kind::MALFORMED_NUMBER : return formatter<string>::format("Malformed number", ctx);
            case aptos::parse::Error::Kind::MALFORMED_BYTES : return formatter<string>::format("Malformed bytes", ctx);
            case aptos::parse::Error::Kind::MALFORMED_OBJECT : return formatter<string>::format("Malformed object", ctx);
            case aptos::parse::Error::Kind::MALFORMED_ADDRESS : return formatter<string>::format("Malformed address", ctx);
            case aptos::parse::Error::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
