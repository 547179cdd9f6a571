#include "math.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace aptos::utils
{
    std::optional<std::uint64_t> strToUint64(const std::string & str)
    {
        if(str.empty())
        {
            return std::nullopt;
        }

        // std::stoull would skip leading whitespace and wrap negative input
        if(!std::ranges::all_of(str, [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            return std::nullopt;
        }

        try
        {
            std::size_t pos = 0;
            const unsigned long long val = std::stoull(str, &pos, 10);

            if(pos != str.size())
            {
                return std::nullopt;
            }

            return static_cast<std::uint64_t>(val);
        }
        catch(const std::out_of_range &)
        {
            return std::nullopt;
        }
        catch(const std::invalid_argument &)
        {
            return std::nullopt;
        }
    }
}
