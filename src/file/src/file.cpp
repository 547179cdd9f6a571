#include "file.hpp"

namespace aptos::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path)
    {
        std::error_code ec;
        if(std::filesystem::is_regular_file(path, ec) == false)
        {
            spdlog::error("Input '{}' is not a readable JSON file", path.string());
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::in);
        if(file.good() == false)
        {
            spdlog::error("Failed to open input '{}'", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        spdlog::debug("Loaded {} bytes of JSON input from '{}'", content.size(), path.string());
        return content;
    }
}
