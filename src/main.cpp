#include <cstdio>
#include <iostream>
#include <iterator>

#include "aptos_json.hpp"

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::filesystem::create_directories(logs_path);

    // stdout carries the encoded value, so the console sink writes to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    const std::string log_name = aptos::utils::currentTimestamp() + "-aptos-json.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    console_sink->set_level(spdlog::level::info);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static const std::string & _helpMessage()
{
    static const std::string help =
        "Usage: aptos-json <type> [file]\n"
        "Decodes a JSON value and prints its canonical encoding.\n"
        "Reads stdin when no file is given.\n"
        "\n"
        "Types:\n"
        "  u64      number or decimal string\n"
        "  bytes    hex (0x...) or base64 string\n"
        "  guid     event guid object\n"
        "  hash     32-byte hash hex string\n"
        "  address  account address string\n"
        "\n"
        "Options:\n"
        "  -h, --help   Display help message and exit\n"
        "  --version    Display version and exit\n";
    return help;
}

template<class T>
static aptos::parse::Result<std::string> _normalize(const std::string & input)
{
    auto value = aptos::parse::parseFromJsonString<T>(input);
    if(!value)
    {
        return std::unexpected(value.error());
    }
    return aptos::parse::parseToJsonString(std::move(*value));
}

static std::optional<aptos::parse::Result<std::string>> _normalizeAs(const std::string & type, const std::string & input)
{
    if(type == "u64")       return _normalize<aptos::types::U64>(input);
    if(type == "bytes")     return _normalize<aptos::types::HexBytes>(input);
    if(type == "guid")      return _normalize<aptos::types::EventGuid>(input);
    if(type == "hash")      return _normalize<aptos::types::Hash>(input);
    if(type == "address")   return _normalize<aptos::types::AccountAddress>(input);
    return std::nullopt;
}

int main(int argc, char* argv[])
{
    aptos::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    cfg.logs_path = cfg.bin_path.parent_path() / "logs";

    _configureLogger(cfg.logs_path);

    spdlog::debug("aptos-json started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    if(argc < 2 || argc > 3)
    {
        std::fprintf(stderr, "%s", _helpMessage().c_str());
        return 1;
    }

    const std::string first_arg = argv[1];

    if(first_arg == "--version")
    {
        std::printf("%u.%u.%u\n", aptos::MAJOR_VERSION, aptos::MINOR_VERSION, aptos::PATCH_VERSION);
        return 0;
    }

    if(first_arg == "--help" || first_arg == "-h")
    {
        std::printf("%s", _helpMessage().c_str());
        return 0;
    }

    std::optional<std::string> input;
    if(argc == 3)
    {
        input = aptos::file::loadTextFile(argv[2]);
        if(!input)
        {
            return 1;
        }
    }
    else
    {
        input = std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }

    const auto result = _normalizeAs(first_arg, *input);
    if(!result)
    {
        spdlog::error("Unknown type '{}'", first_arg);
        return 1;
    }

    if(!result->has_value())
    {
        spdlog::error(std::format("{}: {}", result->error().kind, result->error().message));
        return 1;
    }

    std::printf("%s\n", result->value().c_str());
    return 0;
}
