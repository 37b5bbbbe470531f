#pragma once
// include/blockworld/core/Config.hpp
//
// Process settings read from an INI-style key=value file.

#include <filesystem>
#include <string>

namespace blockworld::core {

struct Config {
    std::string logLevel   = "warn";      // trace|debug|info|warn|error|critical|off
    std::string logFile;                  // empty: stderr only
    std::string stdinToken = "System.in"; // action source meaning standard input ("-" always works)
    bool        atomicSave    = true;
    bool        backupOnSave  = false;
    std::string jsonReport;               // empty: no report
};

// Returns false when the file is missing or unreadable; `cfg` keeps the
// values it had for any key that is absent or fails to parse.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

} // namespace blockworld::core
