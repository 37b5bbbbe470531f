// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.cpp.
//
// Goals:
//   - Saving writes every key and loading round-trips values
//   - Comments, blank lines and unknown keys are tolerated
//   - Bad boolean values keep the previous setting

#include <doctest/doctest.h>

#include "blockworld/core/Config.hpp"

#include "test_support/TempFiles.h"

#include <string>

namespace fs = std::filesystem;
using blockworld::core::Config;

TEST_CASE("core::SaveConfig and core::LoadConfig round-trip values")
{
    blockworld::test::ScopedTempDir dir("blockworld_config_roundtrip");
    const fs::path file = dir.path / "blockworld.ini";

    Config cfg;
    cfg.logLevel = "debug";
    cfg.logFile = "run.log";
    cfg.stdinToken = "STDIN";
    cfg.atomicSave = false;
    cfg.backupOnSave = true;
    cfg.jsonReport = "report.json";

    CHECK(blockworld::core::SaveConfig(cfg, file));

    Config loaded;
    CHECK(blockworld::core::LoadConfig(loaded, file));
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.logFile == "run.log");
    CHECK(loaded.stdinToken == "STDIN");
    CHECK(loaded.atomicSave == false);
    CHECK(loaded.backupOnSave == true);
    CHECK(loaded.jsonReport == "report.json");
}

TEST_CASE("core::LoadConfig returns false for a missing file")
{
    blockworld::test::ScopedTempDir dir("blockworld_config_missing");

    Config cfg; // defaults
    CHECK_FALSE(blockworld::core::LoadConfig(cfg, dir.path / "absent.ini"));
    CHECK(cfg.logLevel == "warn");
    CHECK(cfg.stdinToken == "System.in");
    CHECK(cfg.atomicSave);
    CHECK_FALSE(cfg.backupOnSave);
}

TEST_CASE("core::LoadConfig tolerates comments, whitespace and unknown keys")
{
    blockworld::test::ScopedTempDir dir("blockworld_config_comments");
    const fs::path file = dir.path / "blockworld.ini";

    REQUIRE(blockworld::test::WriteStringToFile(file,
        "# settings\n"
        "; another comment\n"
        "\n"
        "  log_level = info   # while investigating\n"
        "backup_on_save=yes\n"
        "colour=blue\n"
        "no equals sign here\n"
        "stdin_token=\n"));

    Config cfg;
    CHECK(blockworld::core::LoadConfig(cfg, file));
    CHECK(cfg.logLevel == "info");
    CHECK(cfg.backupOnSave);
    // An empty token would make every action path ambiguous.
    CHECK(cfg.stdinToken == "System.in");
}

TEST_CASE("core::LoadConfig keeps previous values for bad booleans")
{
    blockworld::test::ScopedTempDir dir("blockworld_config_bool");
    const fs::path file = dir.path / "blockworld.ini";

    REQUIRE(blockworld::test::WriteStringToFile(file, "atomic_save=maybe\nbackup_on_save=ON\n"));

    Config cfg;
    CHECK(blockworld::core::LoadConfig(cfg, file));
    CHECK(cfg.atomicSave);
    CHECK(cfg.backupOnSave);
}
