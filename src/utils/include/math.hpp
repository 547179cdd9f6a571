#pragma once

#include <optional>
#include <string>
#include <cstdint>

namespace aptos::utils
{
    /**
     * @brief Parses a base-10 literal into a uint64.
     * 
     * Accepts only a non-empty run of ASCII digits. Whitespace, signs and
     * values above 2^64 - 1 are rejected.
     * 
     * @param str The decimal literal.
     * @return The parsed value or std::nullopt.
     */
    std::optional<std::uint64_t> strToUint64(const std::string & str);
}
