#pragma once
#include <filesystem>

namespace aptos::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
    };
}
