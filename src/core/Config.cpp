// src/core/Config.cpp
#include "blockworld/core/Config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace blockworld::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    const std::string text = oss.str();

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos)
        {
            spdlog::warn("{}:{}: ignoring line without '='", file.string(), lineNo);
            continue;
        }

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments:
        //   log_level=debug   # while investigating
        {
            const std::size_t hashPos = v.find('#');
            const std::size_t semiPos = v.find(';');

            std::size_t cut = std::string::npos;
            auto consider = [&](std::size_t p)
            {
                if (p == std::string::npos) return;
                if (cut == std::string::npos || p < cut) cut = p;
            };

            consider(hashPos);
            consider(semiPos);

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (k == "log_level")
        {
            cfg.logLevel = v;
        }
        else if (k == "log_file")
        {
            cfg.logFile = v;
        }
        else if (k == "stdin_token")
        {
            if (!v.empty())
                cfg.stdinToken = v;
        }
        else if (k == "atomic_save")
        {
            bool parsed = cfg.atomicSave;
            if (ParseBool(v, parsed))
                cfg.atomicSave = parsed;
            else
                spdlog::warn("{}:{}: atomic_save expects a boolean", file.string(), lineNo);
        }
        else if (k == "backup_on_save")
        {
            bool parsed = cfg.backupOnSave;
            if (ParseBool(v, parsed))
                cfg.backupOnSave = parsed;
            else
                spdlog::warn("{}:{}: backup_on_save expects a boolean", file.string(), lineNo);
        }
        else if (k == "json_report")
        {
            cfg.jsonReport = v;
        }
        else
        {
            spdlog::debug("{}:{}: unknown key '{}'", file.string(), lineNo, k);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    std::ostringstream oss;
    oss << "log_level="      << cfg.logLevel << "\n";
    oss << "log_file="       << cfg.logFile << "\n";
    oss << "stdin_token="    << cfg.stdinToken << "\n";
    oss << "atomic_save="    << (cfg.atomicSave ? 1 : 0) << "\n";
    oss << "backup_on_save=" << (cfg.backupOnSave ? 1 : 0) << "\n";
    oss << "json_report="    << cfg.jsonReport << "\n";
    const std::string text = oss.str();

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("SaveConfig: cannot open {}", file.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace blockworld::core
