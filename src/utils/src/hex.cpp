#include "hex.hpp"

#include <evmc/hex.hpp>

namespace aptos::utils
{
    bool hasHexPrefix(std::string_view str)
    {
        return str.size() >= 2 && str[0] == '0' && str[1] == 'x';
    }

    std::optional<std::vector<std::uint8_t>> parseHex(std::string_view str)
    {
        const auto decoded = evmc::from_hex(str);
        if(!decoded)
        {
            return std::nullopt;
        }
        return std::vector<std::uint8_t>(decoded->begin(), decoded->end());
    }

    std::string bytesToHex(const std::uint8_t * data, std::size_t size)
    {
        if(data == nullptr || size == 0)
        {
            return "0x";
        }
        return "0x" + evmc::hex(evmc::bytes_view{data, size});
    }

    std::string bytesToHex(const std::vector<std::uint8_t> & bytes)
    {
        return bytesToHex(bytes.data(), bytes.size());
    }
}
