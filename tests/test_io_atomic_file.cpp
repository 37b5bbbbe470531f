// tests/test_io_atomic_file.cpp
//
// Regression coverage for blockworld::io::write_atomic/write_direct.
// write_atomic publishes through a sibling temp file and a rename, so the
// destination is either the old bytes or the new bytes.

#include <doctest/doctest.h>

#include "blockworld/io/AtomicFile.hpp"

#include "test_support/TempFiles.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("blockworld::io::write_atomic round-trips bytes")
{
    blockworld::test::ScopedTempDir dir("blockworld_io_roundtrip");
    const fs::path p = dir.path / "atomic_io_roundtrip.txt";

    INFO("path: ", p.string());

    std::string err;
    CHECK(blockworld::io::write_atomic(p, "hello\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    std::string read;
    CHECK(blockworld::test::ReadFileToString(p, read));
    CHECK(read == "hello\n");

    // Overwrite should succeed and (with make_backup=true) preserve the prior version as .bak
    err.clear();
    CHECK(blockworld::io::write_atomic(p, "world\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    CHECK(blockworld::test::ReadFileToString(p, read));
    CHECK(read == "world\n");

    const fs::path bak = blockworld::io::default_backup_path(p);
    INFO("backup: ", bak.string());

    std::string bak_read;
    CHECK(blockworld::test::ReadFileToString(bak, bak_read));
    CHECK(bak_read == "hello\n");

    CHECK_FALSE(fs::exists(dir.path / "atomic_io_roundtrip.txt.tmp"));
}

TEST_CASE("blockworld::io::write_atomic make_backup=false does not create .bak")
{
    blockworld::test::ScopedTempDir dir("blockworld_io_no_bak");
    const fs::path p = dir.path / "atomic_io_no_bak.txt";
    const fs::path bak = blockworld::io::default_backup_path(p);

    std::string err;
    CHECK(blockworld::io::write_atomic(p, "first", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));

    err.clear();
    CHECK(blockworld::io::write_atomic(p, "second", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));
}

TEST_CASE("blockworld::io::write_atomic failures leave no temp file and report an error")
{
    blockworld::test::ScopedTempDir dir("blockworld_io_fail");

    std::string err;
    const fs::path missingParent = dir.path / "absent" / "file.txt";
    CHECK_FALSE(blockworld::io::write_atomic(missingParent, "x", &err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(fs::exists(dir.path / "absent"));

    err.clear();
    CHECK_FALSE(blockworld::io::write_atomic(dir.path, "x", &err));
    CHECK_FALSE(err.empty());

    // A null error pointer is allowed.
    CHECK_FALSE(blockworld::io::write_direct(missingParent, "x", nullptr));
}
