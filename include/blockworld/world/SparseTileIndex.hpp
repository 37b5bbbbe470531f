#pragma once
// include/blockworld/world/SparseTileIndex.hpp
//
// Lays a tile graph out on the integer grid. Starting from one tile at a known
// position, a breadth-first walk (north, east, south, west) assigns every
// reachable tile the position its exits imply. The index does not own tiles.

#include "blockworld/world/Error.hpp"
#include "blockworld/world/Position.hpp"
#include "blockworld/world/Tile.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace blockworld::world {

class SparseTileIndex {
public:
    // Inconsistent error when a tile would need two positions, or two tiles
    // would share one position. Tiles not reachable from `start` are ignored.
    [[nodiscard]] static Result<SparseTileIndex> Build(const TileGraph& graph,
                                                       TileId start,
                                                       Position startPosition);

    [[nodiscard]] std::optional<TileId> tileAt(Position p) const;
    [[nodiscard]] std::optional<Position> positionOf(TileId id) const;

    // Reachable tiles in breadth-first order; the start tile comes first.
    [[nodiscard]] const std::vector<TileId>& order() const noexcept { return m_order; }
    [[nodiscard]] std::size_t size() const noexcept { return m_order.size(); }

private:
    SparseTileIndex() = default;

    std::unordered_map<Position, TileId, PositionHash> m_byPosition;
    std::unordered_map<TileId, Position> m_byTile;
    std::vector<TileId> m_order;
};

} // namespace blockworld::world
