#pragma once

#include <cstdint>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "config.hpp"
#include "file.hpp"
#include "utils.hpp"
#include "parser.hpp"
#include "types.hpp"

namespace aptos
{
    static constexpr std::uint32_t MAJOR_VERSION = 0;
    static constexpr std::uint32_t MINOR_VERSION = 1;
    static constexpr std::uint32_t PATCH_VERSION = 0;
}
