#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aptos::utils
{
    /**
     * @brief Decodes a hex string, with or without the "0x" prefix.
     * 
     * The digit count must be even. "0x" alone decodes to an empty vector.
     */
    std::optional<std::vector<std::uint8_t>> parseHex(std::string_view str);

    /**
     * @brief Encodes bytes as "0x" followed by lowercase hex digits.
     */
    std::string bytesToHex(const std::vector<std::uint8_t> & bytes);

    std::string bytesToHex(const std::uint8_t * data, std::size_t size);

    bool hasHexPrefix(std::string_view str);
}
