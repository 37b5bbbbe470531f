// src/world/Tile.cpp
#include "blockworld/world/Tile.hpp"

#include <algorithm>
#include <utility>

namespace blockworld::world {

std::expected<Tile, BlockError> Tile::FromBlocks(const std::vector<Block>& blocks)
{
    Tile t;
    t.m_blocks.reserve(blocks.size());
    for (const Block& b : blocks) {
        if (auto placed = t.PlaceBlock(b); !placed)
            return std::unexpected(placed.error());
    }
    return t;
}

std::optional<Block> Tile::top() const noexcept
{
    if (m_blocks.empty())
        return std::nullopt;
    return m_blocks.back();
}

std::expected<void, BlockError> Tile::PlaceBlock(Block block)
{
    if (m_blocks.size() >= kMaxHeight)
        return std::unexpected(BlockError::TooHigh);
    if (block.ground() && m_blocks.size() >= kMaxGroundHeight)
        return std::unexpected(BlockError::TooHigh);

    m_blocks.push_back(block);
    return {};
}

std::expected<Block, BlockError> Tile::Dig()
{
    if (m_blocks.empty())
        return std::unexpected(BlockError::TooLow);
    if (!m_blocks.back().diggable())
        return std::unexpected(BlockError::InvalidBlock);

    const Block removed = m_blocks.back();
    m_blocks.pop_back();
    return removed;
}

std::size_t Tile::exitCount() const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(m_exits.begin(), m_exits.end(), [](const auto& e) { return e.has_value(); }));
}

TileId TileGraph::Add(Tile tile)
{
    const auto id = static_cast<TileId>(m_tiles.size());
    m_tiles.push_back(std::move(tile));
    return id;
}

Tile& TileGraph::at(TileId id)
{
    BLOCKWORLD_ASSERT(contains(id));
    return m_tiles[id];
}

const Tile& TileGraph::at(TileId id) const
{
    BLOCKWORLD_ASSERT(contains(id));
    return m_tiles[id];
}

void TileGraph::AddExit(TileId from, Direction d, TileId to)
{
    BLOCKWORLD_ASSERT(contains(from) && contains(to));
    m_tiles[from].SetExit(d, to);
}

void TileGraph::RemoveExit(TileId from, Direction d)
{
    BLOCKWORLD_ASSERT(contains(from));
    m_tiles[from].ClearExit(d);
}

std::expected<void, BlockError> TileGraph::MoveBlock(TileId from, Direction d)
{
    Tile& source = at(from);
    const auto target = source.exit(d);
    if (!target)
        return std::unexpected(BlockError::NoExit);

    const auto top = source.top();
    if (!top || !top->moveable())
        return std::unexpected(BlockError::InvalidBlock);

    Tile& dest = at(*target);
    if (dest.height() >= source.height())
        return std::unexpected(BlockError::TooHigh);

    if (auto placed = dest.PlaceBlock(*top); !placed)
        return placed;

    source.m_blocks.pop_back();
    return {};
}

} // namespace blockworld::world
