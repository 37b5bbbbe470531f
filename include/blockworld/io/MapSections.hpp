#pragma once
// include/blockworld/io/MapSections.hpp
//
// Section parsers of the world map format. Each consumes exactly the lines
// of its own section from the reader, so the caller chains them with the
// blank-line separators and the final end-of-input check.
//
//   <startX>
//   <startY>
//   <builder name>
//   <inventory blocks>
//
//   total:<N>
//   <id> <blocks>          (N rows, any order)
//
//   exits
//   <id> <dir:id,...>      (N rows, any order)

#include "blockworld/io/LineGrammar.hpp"
#include "blockworld/world/Builder.hpp"
#include "blockworld/world/Position.hpp"
#include "blockworld/world/Tile.hpp"

#include <vector>

namespace blockworld::io {

struct BuilderSection {
    world::Position start;
    world::TileId startTile = 0;
    world::Builder builder;
};

// Adds a fresh, empty starting tile to `graph` and a builder standing on it.
[[nodiscard]] Result<BuilderSection> ParseBuilderSection(LineReader& reader, world::TileGraph& graph);

[[nodiscard]] Result<void> ParseBlankLine(LineReader& reader);

// Returns the arena ids indexed by file tile id; file id 0 is `startTile`
// (which receives the blocks of row 0), the others are new tiles.
[[nodiscard]] Result<std::vector<world::TileId>> ParseTilesSection(LineReader& reader,
                                                                   world::TileGraph& graph,
                                                                   world::TileId startTile);

// Wires the exits of every tile in `tiles` (indexed by file tile id).
[[nodiscard]] Result<void> ParseExitsSection(LineReader& reader,
                                             world::TileGraph& graph,
                                             const std::vector<world::TileId>& tiles);

} // namespace blockworld::io
