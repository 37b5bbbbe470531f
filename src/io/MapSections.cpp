// src/io/MapSections.cpp
#include "blockworld/io/MapSections.hpp"

#include "blockworld/world/BlockRegistry.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace blockworld::io {

using world::Block;
using world::BlockError;
using world::FormatError;
using world::TileId;

namespace {

// Reads one line and runs `parse` on it, binding any error to that line.
template <typename Fn>
[[nodiscard]] auto ReadAndParse(LineReader& reader, Fn&& parse)
    -> decltype(parse(std::string_view{}))
{
    auto line = reader.ReadLine();
    if (!line)
        return std::unexpected(std::move(line.error()));
    return AtLine(parse(std::string_view(*line)), reader.line());
}

[[nodiscard]] std::string BlockErrorText(BlockError e)
{
    return std::string(world::BlockErrorName(e));
}

} // namespace

Result<BuilderSection> ParseBuilderSection(LineReader& reader, world::TileGraph& graph)
{
    auto x = ReadAndParse(reader, ParseInt);
    if (!x)
        return std::unexpected(std::move(x.error()));
    auto y = ReadAndParse(reader, ParseInt);
    if (!y)
        return std::unexpected(std::move(y.error()));

    auto name = reader.ReadLine();
    if (!name)
        return std::unexpected(std::move(name.error()));

    auto inventory = ReadAndParse(reader, world::ResolveBlockList);
    if (!inventory)
        return std::unexpected(std::move(inventory.error()));
    const int inventoryLine = reader.line();

    const TileId startTile = graph.Add(world::Tile{});
    auto builder = world::Builder::Create(std::move(*name), startTile, std::move(*inventory));
    if (!builder) {
        if (builder.error() == BlockError::InvalidBlock)
            return FormatError("inventory holds a block that cannot be carried", inventoryLine);
        // An empty starting tile cannot be too high or too low.
        BLOCKWORLD_ASSERT(false);
        return FormatError("builder rejected: " + BlockErrorText(builder.error()), inventoryLine);
    }

    return BuilderSection{world::Position{*x, *y}, startTile, std::move(*builder)};
}

Result<void> ParseBlankLine(LineReader& reader)
{
    auto line = reader.ReadLine();
    if (!line)
        return std::unexpected(std::move(line.error()));
    if (!line->empty())
        return FormatError("expected a blank line", reader.line());
    return {};
}

Result<std::vector<TileId>> ParseTilesSection(LineReader& reader,
                                              world::TileGraph& graph,
                                              TileId startTile)
{
    auto header = ReadAndParse(reader, [](std::string_view s) { return ParseLabeledCounts(s, true); });
    if (!header)
        return std::unexpected(std::move(header.error()));

    const auto total = header->find("total");
    if (total == header->end())
        return FormatError("expected total:<N>", reader.line());
    const std::int32_t count = total->second;
    if (count < 1)
        return FormatError("a map needs at least one tile", reader.line());

    // Rows may arrive in any order.
    std::unordered_map<std::int32_t, std::pair<std::vector<Block>, int>> rows;
    for (std::int32_t i = 0; i < count; ++i) {
        auto row = ReadAndParse(reader, ParseNumberedRow);
        if (!row)
            return std::unexpected(std::move(row.error()));

        if (row->id < 0 || row->id >= count)
            return FormatError("tile id " + std::to_string(row->id) + " outside [0, " +
                                   std::to_string(count) + ")",
                               reader.line());
        if (rows.contains(row->id))
            return FormatError("duplicate tile id " + std::to_string(row->id), reader.line());

        auto blocks = AtLine(world::ResolveBlockList(row->rest), reader.line());
        if (!blocks)
            return std::unexpected(std::move(blocks.error()));

        rows.emplace(row->id, std::make_pair(std::move(*blocks), reader.line()));
    }

    std::vector<TileId> tiles;
    tiles.reserve(static_cast<std::size_t>(count));
    tiles.push_back(startTile);

    // Tile 0 is the builder's starting tile, created empty by the builder section.
    {
        const auto& [blocks, line] = rows.at(0);
        world::Tile& start = graph.at(startTile);
        for (const Block& b : blocks) {
            if (auto placed = start.PlaceBlock(b); !placed)
                return FormatError("tile 0: " + BlockErrorText(placed.error()), line);
        }
    }

    for (std::int32_t id = 1; id < count; ++id) {
        const auto& [blocks, line] = rows.at(id);
        auto tile = world::Tile::FromBlocks(blocks);
        if (!tile)
            return FormatError("tile " + std::to_string(id) + ": " + BlockErrorText(tile.error()), line);
        tiles.push_back(graph.Add(std::move(*tile)));
    }

    spdlog::debug("parsed {} tile rows", count);
    return tiles;
}

Result<void> ParseExitsSection(LineReader& reader,
                               world::TileGraph& graph,
                               const std::vector<TileId>& tiles)
{
    auto marker = reader.ReadLine();
    if (!marker)
        return std::unexpected(std::move(marker.error()));
    if (*marker != "exits")
        return FormatError("expected 'exits'", reader.line());

    const auto count = static_cast<std::int32_t>(tiles.size());
    std::unordered_set<std::int32_t> seen;

    for (std::int32_t i = 0; i < count; ++i) {
        auto row = ReadAndParse(reader, ParseNumberedRow);
        if (!row)
            return std::unexpected(std::move(row.error()));

        if (row->id < 0 || row->id >= count)
            return FormatError("tile id " + std::to_string(row->id) + " outside [0, " +
                                   std::to_string(count) + ")",
                               reader.line());
        if (!seen.insert(row->id).second)
            return FormatError("exits for tile " + std::to_string(row->id) + " given twice", reader.line());

        // Repeated directions are rejected by the grammar's repeated-label rule.
        auto exits = AtLine(ParseLabeledCounts(row->rest, false), reader.line());
        if (!exits)
            return std::unexpected(std::move(exits.error()));

        for (const auto& [label, target] : *exits) {
            const auto dir = world::ParseDirection(label);
            if (!dir)
                return FormatError("unknown direction '" + label + "'", reader.line());
            if (target < 0 || target >= count)
                return FormatError("exit target " + std::to_string(target) + " outside [0, " +
                                       std::to_string(count) + ")",
                                   reader.line());

            graph.AddExit(tiles[static_cast<std::size_t>(row->id)], *dir,
                          tiles[static_cast<std::size_t>(target)]);
        }
    }
    return {};
}

} // namespace blockworld::io
