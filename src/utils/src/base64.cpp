#include "base64.hpp"

#include <stdexcept>

#include <jwt-cpp/base.h>

namespace aptos::utils
{
    std::optional<std::vector<std::uint8_t>> decodeBase64(const std::string & str)
    {
        try
        {
            const std::string decoded = jwt::base::decode<jwt::alphabet::base64>(str);
            return std::vector<std::uint8_t>(decoded.begin(), decoded.end());
        }
        catch(const std::runtime_error &)
        {
            return std::nullopt;
        }
    }

    std::string encodeBase64(const std::vector<std::uint8_t> & bytes)
    {
        return jwt::base::encode<jwt::alphabet::base64>(std::string(bytes.begin(), bytes.end()));
    }
}
