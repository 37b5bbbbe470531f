#pragma once
// include/blockworld/world/Builder.hpp

#include "blockworld/world/Block.hpp"
#include "blockworld/world/Error.hpp"
#include "blockworld/world/Tile.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace blockworld::world {

// The single actor of a world: stands on one tile and carries blocks.
class Builder {
public:
    // Fails with InvalidBlock when any inventory block cannot be carried.
    [[nodiscard]] static std::expected<Builder, BlockError> Create(std::string name,
                                                                   TileId currentTile,
                                                                   std::vector<Block> inventory);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] TileId currentTile() const noexcept { return m_current; }
    [[nodiscard]] const std::vector<Block>& inventory() const noexcept { return m_inventory; }

    // Height difference of at most one, reached through an exit of the current tile.
    [[nodiscard]] bool CanEnter(const TileGraph& graph, TileId target) const;
    [[nodiscard]] std::expected<void, BlockError> MoveTo(const TileGraph& graph, Direction d);

    // Removes the top block of the current tile; carryable blocks go to the inventory.
    [[nodiscard]] std::expected<void, BlockError> DigOnCurrentTile(TileGraph& graph);

    [[nodiscard]] std::expected<void, BlockError> DropFromInventory(TileGraph& graph, std::size_t index);

private:
    Builder(std::string name, TileId current, std::vector<Block> inventory);

    std::string m_name;
    TileId m_current = 0;
    std::vector<Block> m_inventory;
};

} // namespace blockworld::world
