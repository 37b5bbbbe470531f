// src/world/Builder.cpp
#include "blockworld/world/Builder.hpp"

#include <cstdlib>
#include <utility>

namespace blockworld::world {

Builder::Builder(std::string name, TileId current, std::vector<Block> inventory)
    : m_name(std::move(name)), m_current(current), m_inventory(std::move(inventory))
{
}

std::expected<Builder, BlockError> Builder::Create(std::string name,
                                                   TileId currentTile,
                                                   std::vector<Block> inventory)
{
    for (const Block& b : inventory) {
        if (!b.carryable())
            return std::unexpected(BlockError::InvalidBlock);
    }
    return Builder(std::move(name), currentTile, std::move(inventory));
}

bool Builder::CanEnter(const TileGraph& graph, TileId target) const
{
    const Tile& here = graph.at(m_current);

    bool linked = false;
    for (const Direction d : kAllDirections) {
        if (here.exit(d) == target) {
            linked = true;
            break;
        }
    }
    if (!linked)
        return false;

    const auto a = static_cast<long long>(here.height());
    const auto b = static_cast<long long>(graph.at(target).height());
    return std::llabs(a - b) <= 1;
}

std::expected<void, BlockError> Builder::MoveTo(const TileGraph& graph, Direction d)
{
    const auto target = graph.at(m_current).exit(d);
    if (!target || !CanEnter(graph, *target))
        return std::unexpected(BlockError::NoExit);

    m_current = *target;
    return {};
}

std::expected<void, BlockError> Builder::DigOnCurrentTile(TileGraph& graph)
{
    auto dug = graph.at(m_current).Dig();
    if (!dug)
        return std::unexpected(dug.error());

    if (dug->carryable())
        m_inventory.push_back(*dug);
    return {};
}

std::expected<void, BlockError> Builder::DropFromInventory(TileGraph& graph, std::size_t index)
{
    if (index >= m_inventory.size())
        return std::unexpected(BlockError::InvalidBlock);

    if (auto placed = graph.at(m_current).PlaceBlock(m_inventory[index]); !placed)
        return placed;

    m_inventory.erase(m_inventory.begin() + static_cast<std::ptrdiff_t>(index));
    return {};
}

} // namespace blockworld::world
