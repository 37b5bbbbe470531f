#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockworld::app {

// Parsed command line of the blockworld executable.
//
// Notes:
//   - Both "--opt value" and "--opt=value" forms are supported.
//   - A lone "-" is positional (it names standard input as the action source).
//   - "--" ends option parsing.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h

    std::optional<std::string> configPath;  // --config <file>
    std::optional<std::string> logLevel;    // --log-level <level>
    std::optional<std::string> jsonReport;  // --json-report <file>

    // inputMap, actions, outputMap
    std::vector<std::string> positional;

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace blockworld::app
