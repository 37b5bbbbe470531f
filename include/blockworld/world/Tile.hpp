#pragma once
// include/blockworld/world/Tile.hpp
//
// Tiles are stored in a TileGraph arena and addressed by TileId. Exits are
// directed TileId edges, one per compass direction; adding north from A to B
// says nothing about a south exit from B to A.

#include "blockworld/world/Block.hpp"
#include "blockworld/world/Error.hpp"
#include "blockworld/world/Position.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace blockworld::world {

using TileId = std::uint32_t;

// Stack limits: any block needs fewer than kMaxHeight blocks below it,
// a ground block fewer than kMaxGroundHeight.
inline constexpr std::size_t kMaxHeight       = 7;
inline constexpr std::size_t kMaxGroundHeight = 2;

class Tile {
public:
    Tile() = default;

    // Builds a tile by placing `blocks` bottom to top.
    [[nodiscard]] static std::expected<Tile, BlockError> FromBlocks(const std::vector<Block>& blocks);

    [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return m_blocks; }
    [[nodiscard]] std::size_t height() const noexcept { return m_blocks.size(); }
    [[nodiscard]] std::optional<Block> top() const noexcept;

    // The place(tile, block) contract.
    [[nodiscard]] std::expected<void, BlockError> PlaceBlock(Block block);

    // Removes and returns the top block.
    [[nodiscard]] std::expected<Block, BlockError> Dig();

    [[nodiscard]] std::optional<TileId> exit(Direction d) const noexcept { return m_exits[DirectionIndex(d)]; }
    [[nodiscard]] std::size_t exitCount() const noexcept;

    void SetExit(Direction d, TileId target) noexcept { m_exits[DirectionIndex(d)] = target; }
    void ClearExit(Direction d) noexcept { m_exits[DirectionIndex(d)].reset(); }

private:
    friend class TileGraph;

    std::vector<Block> m_blocks;
    std::array<std::optional<TileId>, kDirectionCount> m_exits{};
};

// Owns every tile of a world. Ids are stable for the lifetime of the graph.
class TileGraph {
public:
    [[nodiscard]] TileId Add(Tile tile);

    [[nodiscard]] std::size_t size() const noexcept { return m_tiles.size(); }
    [[nodiscard]] bool contains(TileId id) const noexcept { return id < m_tiles.size(); }

    [[nodiscard]] Tile& at(TileId id);
    [[nodiscard]] const Tile& at(TileId id) const;

    // Both ids must already belong to this graph.
    void AddExit(TileId from, Direction d, TileId to);
    void RemoveExit(TileId from, Direction d);

    // Moves the top block of `from` through its exit `d`. The block must be
    // moveable and the target must be lower than `from`.
    [[nodiscard]] std::expected<void, BlockError> MoveBlock(TileId from, Direction d);

private:
    std::vector<Tile> m_tiles;
};

} // namespace blockworld::world
