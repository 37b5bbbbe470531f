#pragma once
// include/blockworld/world/WorldMap.hpp
//
// A loaded block world: the tile arena, the builder, the start position and
// the grid layout computed from the exits. A WorldMap only exists in a
// consistent state; both factories run the grid layout before returning.

#include "blockworld/world/Builder.hpp"
#include "blockworld/world/Error.hpp"
#include "blockworld/world/Position.hpp"
#include "blockworld/world/SparseTileIndex.hpp"
#include "blockworld/world/Tile.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <istream>
#include <optional>
#include <vector>

namespace blockworld::world {

class WorldMap {
public:
    // Io error if the file cannot be opened, Format error for grammar and
    // stacking violations, Inconsistent error for an impossible layout.
    [[nodiscard]] static Result<WorldMap> Load(const std::filesystem::path& path);
    [[nodiscard]] static Result<WorldMap> Load(std::istream& in);

    // From tiles already in memory; only the grid layout is checked.
    [[nodiscard]] static Result<WorldMap> Create(TileGraph graph,
                                                 TileId startTile,
                                                 Position startPosition,
                                                 Builder builder);

    [[nodiscard]] const Builder& builder() const noexcept { return m_builder; }

    [[nodiscard]] Position startPosition() const noexcept { return m_startPosition; }
    [[nodiscard]] TileId startTile() const noexcept { return m_startTile; }

    // Reachable tiles in breadth-first order from the start tile.
    [[nodiscard]] const std::vector<TileId>& tiles() const noexcept { return m_index.order(); }

    [[nodiscard]] std::optional<TileId> tileAt(Position p) const { return m_index.tileAt(p); }
    [[nodiscard]] std::optional<Position> positionOf(TileId id) const { return m_index.positionOf(id); }

    [[nodiscard]] const Tile& tile(TileId id) const { return m_graph.at(id); }

    [[nodiscard]] const TileGraph& graph() const noexcept { return m_graph; }

    // Builder and block operations. They change block stacks and the builder
    // but never exits, so the grid layout stays valid.
    [[nodiscard]] std::expected<void, BlockError> MoveBuilder(Direction d);
    [[nodiscard]] std::expected<void, BlockError> MoveBlock(Direction d);
    [[nodiscard]] std::expected<void, BlockError> Dig();
    [[nodiscard]] std::expected<void, BlockError> Drop(std::size_t inventoryIndex);

private:
    WorldMap(TileGraph graph, TileId startTile, Position startPosition, Builder builder, SparseTileIndex index);

    TileGraph m_graph;
    TileId m_startTile = 0;
    Position m_startPosition;
    Builder m_builder;
    SparseTileIndex m_index;
};

} // namespace blockworld::world
