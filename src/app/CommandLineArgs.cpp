#include "blockworld/app/CommandLineArgs.hpp"

#include <sstream>

namespace blockworld::app {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool ConsumeValue(std::string_view arg,
                               std::string_view prefix,
                               std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    // --opt=value
    const std::size_t n = prefix.size();
    if (arg.size() == n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    bool optionsDone = false;
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view arg = argv[i];

        if (optionsDone || arg == "-" || !StartsWith(arg, "-"))
        {
            out.positional.emplace_back(arg);
            continue;
        }

        if (arg == "--")
        {
            optionsDone = true;
            continue;
        }

        if (arg == "--help" || arg == "-h")
        {
            out.showHelp = true;
            continue;
        }

        std::string_view value;

        const auto takeNext = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argv.size()) {
                out.unknown.emplace_back(arg);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        if (arg == "--config") { takeNext(out.configPath); continue; }
        if (ConsumeValue(arg, "--config", value)) { out.configPath = std::string(value); continue; }

        if (arg == "--log-level") { takeNext(out.logLevel); continue; }
        if (ConsumeValue(arg, "--log-level", value)) { out.logLevel = std::string(value); continue; }

        if (arg == "--json-report") { takeNext(out.jsonReport); continue; }
        if (ConsumeValue(arg, "--json-report", value)) { out.jsonReport = std::string(value); continue; }

        // Anything else is unknown.
        out.unknown.emplace_back(arg);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "Usage: program inputMap actions outputMap\n\n";
    oss << "Loads inputMap, applies the actions (a file, or System.in / - for standard input)\n";
    oss << "and saves the resulting world to outputMap.\n\n";
    oss << "Options\n";
    oss << "  --config <file>         Read settings from an INI file (key=value)\n";
    oss << "  --log-level <level>     trace, debug, info, warn, error, critical or off\n";
    oss << "  --json-report <file>    Also write a JSON report of the saved world\n";
    oss << "  --help, -h              Show this help\n\n";
    oss << "Exit codes\n";
    oss << "  1 wrong arguments, 2 cannot load inputMap, 3 cannot open actions,\n";
    oss << "  4 bad actions, 5 cannot save outputMap\n";
    return oss.str();
}

} // namespace blockworld::app
