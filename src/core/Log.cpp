// src/core/Log.cpp
#include "blockworld/core/Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>
#include <vector>

namespace blockworld::core {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

} // namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view s) noexcept
{
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return std::nullopt;
}

bool InitLogging(const Config& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool fileOk = true;
    if (!cfg.logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.logFile, false));
        } catch (const spdlog::spdlog_ex&) {
            fileOk = false;
        }
    }

    g_logger = std::make_shared<spdlog::logger>("blockworld", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(ParseLogLevel(cfg.logLevel).value_or(spdlog::level::warn));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!ParseLogLevel(cfg.logLevel))
        spdlog::warn("unknown log level '{}'; using warn", cfg.logLevel);
    if (!fileOk)
        spdlog::warn("cannot open log file {}; logging to stderr only", cfg.logFile);
    return fileOk;
}

} // namespace blockworld::core
