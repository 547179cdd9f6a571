#pragma once

#include <fstream>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace aptos::file
{
    /**
     * @brief Reads the JSON input of the CLI.
     * 
     * @return The file content, or std::nullopt when the path is missing,
     * is not a regular file, or cannot be opened.
     */
    std::optional<std::string> loadTextFile(std::filesystem::path path);
}
