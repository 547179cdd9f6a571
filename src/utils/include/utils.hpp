#pragma once

#include <string>

namespace aptos::utils
{
    /**
     * @brief Current local time formatted for use in file names.
     */
    std::string currentTimestamp();
}
