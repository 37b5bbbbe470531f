#pragma once
// include/blockworld/core/Log.hpp

#include "blockworld/core/Config.hpp"

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace blockworld::core {

// Installs the "blockworld" logger (stderr, plus cfg.logFile when set) as the
// spdlog default logger. Returns false if the log file could not be opened;
// logging then continues on stderr alone.
bool InitLogging(const Config& cfg);

[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view s) noexcept;

} // namespace blockworld::core
