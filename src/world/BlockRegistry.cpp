// src/world/BlockRegistry.cpp
#include "blockworld/world/BlockRegistry.hpp"

#include <array>
#include <string>
#include <utility>

namespace blockworld::world {

namespace {

struct RegistryEntry {
    std::string_view token;
    BlockKind kind;
};

constexpr std::array<RegistryEntry, kBlockKindCount> kRegistry = {{
    {BlockToken(BlockKind::Wood),  BlockKind::Wood},
    {BlockToken(BlockKind::Grass), BlockKind::Grass},
    {BlockToken(BlockKind::Soil),  BlockKind::Soil},
    {BlockToken(BlockKind::Stone), BlockKind::Stone},
}};

} // namespace

std::optional<BlockKind> LookupBlockKind(std::string_view token) noexcept
{
    for (const RegistryEntry& e : kRegistry) {
        if (e.token == token)
            return e.kind;
    }
    return std::nullopt;
}

Result<Block> ResolveBlock(std::string_view token)
{
    const auto kind = LookupBlockKind(token);
    if (!kind)
        return FormatError("unknown block type '" + std::string(token) + "'");
    return Block{*kind};
}

Result<std::vector<Block>> ResolveBlockList(std::string_view list)
{
    std::vector<Block> out;
    if (list.empty())
        return out;

    while (true) {
        const std::size_t comma = list.find(',');
        const std::string_view token = list.substr(0, comma);

        auto block = ResolveBlock(token);
        if (!block)
            return std::unexpected(std::move(block.error()));
        out.push_back(*block);

        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace blockworld::world
