#pragma once
// include/blockworld/io/AtomicFile.hpp
//
// File publishing used by the map writer.
//
//  - write_atomic: writes a sibling "<final>.tmp", flushes and closes it, then
//    renames it over the destination. A failed write leaves the destination
//    untouched and removes the temp file.
//  - write_direct: truncates and writes the destination in place.
//
// Neither creates missing parent directories.

#include <filesystem>
#include <string>

namespace blockworld::io {

namespace fs = std::filesystem;

/// @param make_backup  If true and the destination exists, copy it to "<final>.bak" first.
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                const std::string& bytes,
                                std::string* err,
                                bool make_backup = false);

[[nodiscard]] bool write_direct(const fs::path& path,
                                const std::string& bytes,
                                std::string* err);

/// "<final>.bak", the backup written by write_atomic when make_backup is set.
[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace blockworld::io
