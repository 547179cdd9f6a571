#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aptos::utils
{
    /**
     * @brief Decodes standard (RFC 4648, '=' padded) base64.
     * 
     * @return The decoded bytes or std::nullopt when the input contains
     * characters outside the alphabet or has an invalid padded length.
     */
    std::optional<std::vector<std::uint8_t>> decodeBase64(const std::string & str);

    std::string encodeBase64(const std::vector<std::uint8_t> & bytes);
}
