#pragma once
// include/blockworld/world/BlockRegistry.hpp
//
// Maps the lowercase block tokens of the map format to block kinds.
// New kinds are added to the table in BlockRegistry.cpp and to BlockKind;
// the grammar does not change.

#include "blockworld/world/Block.hpp"
#include "blockworld/world/Error.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace blockworld::world {

[[nodiscard]] std::optional<BlockKind> LookupBlockKind(std::string_view token) noexcept;

// Format error on an unknown token.
[[nodiscard]] Result<Block> ResolveBlock(std::string_view token);

// Comma-delimited, no spaces. The empty string is the empty list; any other
// empty or unknown token fails the whole list.
[[nodiscard]] Result<std::vector<Block>> ResolveBlockList(std::string_view list);

} // namespace blockworld::world
