// src/app/BlockWorldApp.cpp
#include "blockworld/app/BlockWorldApp.hpp"

#include "blockworld/actions/Actions.hpp"
#include "blockworld/app/CommandLineArgs.hpp"
#include "blockworld/core/Config.hpp"
#include "blockworld/core/Log.hpp"
#include "blockworld/io/MapWriter.hpp"
#include "blockworld/io/WorldReport.hpp"
#include "blockworld/world/WorldMap.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace blockworld::app {

int RunBlockWorld(const std::vector<std::string_view>& argv,
                  std::istream& in,
                  std::ostream& out,
                  std::ostream& err)
{
    const CommandLineArgs args = ParseCommandLineArgsFromArgv(argv);

    if (args.showHelp)
    {
        out << BuildCommandLineHelpText();
        return kExitOk;
    }

    if (!args.unknown.empty())
    {
        err << "Unknown or incomplete option: " << args.unknown.front() << "\n";
        err << "Usage: program inputMap actions outputMap\n";
        return kExitUsage;
    }

    if (args.positional.size() != 3)
    {
        err << "Usage: program inputMap actions outputMap\n";
        return kExitUsage;
    }

    core::Config cfg;
    if (args.configPath && !core::LoadConfig(cfg, *args.configPath))
    {
        err << "Cannot read config file: " << *args.configPath << "\n";
        return kExitUsage;
    }
    if (args.logLevel)
    {
        if (!core::ParseLogLevel(*args.logLevel))
        {
            err << "Unknown log level: " << *args.logLevel << "\n";
            return kExitUsage;
        }
        cfg.logLevel = *args.logLevel;
    }
    if (args.jsonReport)
        cfg.jsonReport = *args.jsonReport;

    core::InitLogging(cfg);

    const std::string& inputMap = args.positional[0];
    const std::string& actionSource = args.positional[1];
    const std::string& outputMap = args.positional[2];

    auto map = world::WorldMap::Load(inputMap);
    if (!map)
    {
        err << map.error().Describe() << "\n";
        return kExitLoadFailed;
    }

    std::ifstream actionFile;
    std::istream* actions = &in;
    if (actionSource != cfg.stdinToken && actionSource != "-")
    {
        // ifstream opens a directory fine and only fails on the first read.
        std::error_code ec;
        if (!std::filesystem::is_directory(actionSource, ec))
            actionFile.open(actionSource, std::ios::binary);
        if (!actionFile.is_open() || !actionFile)
        {
            err << "Cannot open actions: " << actionSource << "\n";
            return kExitActionsOpen;
        }
        actions = &actionFile;
    }

    if (auto processed = actions::ProcessActions(*actions, *map, out); !processed)
    {
        err << processed.error().Describe() << "\n";
        return kExitActionsFailed;
    }

    io::SaveOptions saveOptions;
    saveOptions.atomic = cfg.atomicSave;
    saveOptions.makeBackup = cfg.backupOnSave;
    if (auto saved = io::SaveWorldMap(*map, outputMap, saveOptions); !saved)
    {
        err << saved.error().Describe() << "\n";
        return kExitSaveFailed;
    }

    if (!cfg.jsonReport.empty())
    {
        // The map itself is saved; a failed report is not a save failure.
        if (auto report = io::WriteWorldReport(*map, cfg.jsonReport); !report)
            spdlog::warn("{}", report.error().Describe());
    }

    return kExitOk;
}

} // namespace blockworld::app
