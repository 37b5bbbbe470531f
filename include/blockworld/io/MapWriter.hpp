#pragma once
// include/blockworld/io/MapWriter.hpp
//
// Writes a WorldMap back in the grammar MapSections.hpp reads. Tile ids are
// positions in WorldMap::tiles(), so only reachable tiles are written.

#include "blockworld/world/Error.hpp"
#include "blockworld/world/WorldMap.hpp"

#include <filesystem>
#include <string>

namespace blockworld::io {

using world::Result;

struct SaveOptions {
    bool atomic = true;      // temp file + rename
    bool makeBackup = false; // keep "<path>.bak" of a previous file
};

[[nodiscard]] std::string FormatWorldMap(const world::WorldMap& map);

// Io error when the destination cannot be opened or written.
[[nodiscard]] Result<void> SaveWorldMap(const world::WorldMap& map,
                                        const std::filesystem::path& path,
                                        const SaveOptions& options = {});

} // namespace blockworld::io
