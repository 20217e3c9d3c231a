#include <ctrlc/core/ConfigLoader.hpp>

#include <ctrlc/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace ctrlc::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

void printUsage(const char *argv0)
{
    std::string exe = "ctrlc_demo";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
    std::cout << "Usage: " << exe << " [--config <path.toml>]\n";
}

std::string toLower(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v;
}

LogLevel parseLogLevel(std::string_view s)
{
    const std::string v = toLower(s);

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid logging.level: " + std::string(s));
}

DemoMode parseDemoMode(std::string_view s)
{
    const std::string v = toLower(s);

    if (v == "sync")
        return DemoMode::Sync;
    if (v == "async")
        return DemoMode::Async;

    throw std::invalid_argument("Invalid demo.mode: " + std::string(s) + " (expected sync|async)");
}

std::uint32_t checkedPositiveU32(std::int64_t v, const char *key)
{
    if (v < 1 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throw std::invalid_argument(std::string(key) + " must be >= 1: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Main Parsing Logic
// -----------------------------------------------------------------------------

void applyLoggingToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *logging = root["logging"].as_table();
    if (!logging)
        return;

    if (auto s = (*logging)["level"].value<std::string>())
        cfg.logging.level = parseLogLevel(*s);
    if (auto s = (*logging)["file"].value<std::string>())
        cfg.logging.file = *s;
}

void applyDemoToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *demo = root["demo"].as_table();
    if (!demo)
        return;

    if (auto s = (*demo)["mode"].value<std::string>())
        cfg.demo.mode = parseDemoMode(*s);

    if (auto v = (*demo)["max_interrupts"].value<std::int64_t>())
        cfg.demo.maxInterrupts = checkedPositiveU32(*v, "demo.max_interrupts");

    if (auto b = (*demo)["strict"].value<bool>())
        cfg.demo.strict = *b;
}

} // namespace

namespace ctrlc::core
{

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        return GlobalConfig{};
    }
    return loadFile(*configOpt);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.what()));
    }

    GlobalConfig cfg{};
    applyLoggingToml(cfg, root);
    applyDemoToml(cfg, root);

    CTRLC_LOG_INFO("ConfigLoader", "Loaded", "path='{}' level={} mode={} max_interrupts={} strict={}",
                   path, logLevelName(cfg.logging.level),
                   cfg.demo.mode == DemoMode::Async ? "async" : "sync", cfg.demo.maxInterrupts,
                   cfg.demo.strict);
    return cfg;
}

} // namespace ctrlc::core
