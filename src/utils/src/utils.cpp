#include <chrono>
#include <format>

#include "utils.hpp"

namespace aptos::utils
{
    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        return std::format("{:%F-%H_%M_%S}", zt);
    }
}
