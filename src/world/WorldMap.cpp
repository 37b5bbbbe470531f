// src/world/WorldMap.cpp
#include "blockworld/world/WorldMap.hpp"

#include "blockworld/io/LineGrammar.hpp"
#include "blockworld/io/MapSections.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace blockworld::world {

WorldMap::WorldMap(TileGraph graph, TileId startTile, Position startPosition, Builder builder, SparseTileIndex index)
    : m_graph(std::move(graph))
    , m_startTile(startTile)
    , m_startPosition(startPosition)
    , m_builder(std::move(builder))
    , m_index(std::move(index))
{
}

Result<WorldMap> WorldMap::Create(TileGraph graph, TileId startTile, Position startPosition, Builder builder)
{
    BLOCKWORLD_ASSERT(graph.contains(startTile));
    BLOCKWORLD_ASSERT(graph.contains(builder.currentTile()));

    auto index = SparseTileIndex::Build(graph, startTile, startPosition);
    if (!index)
        return std::unexpected(std::move(index.error()));

    return WorldMap(std::move(graph), startTile, startPosition, std::move(builder), std::move(*index));
}

std::expected<void, BlockError> WorldMap::MoveBuilder(Direction d)
{
    return m_builder.MoveTo(m_graph, d);
}

std::expected<void, BlockError> WorldMap::MoveBlock(Direction d)
{
    return m_graph.MoveBlock(m_builder.currentTile(), d);
}

std::expected<void, BlockError> WorldMap::Dig()
{
    return m_builder.DigOnCurrentTile(m_graph);
}

std::expected<void, BlockError> WorldMap::Drop(std::size_t inventoryIndex)
{
    return m_builder.DropFromInventory(m_graph, inventoryIndex);
}

Result<WorldMap> WorldMap::Load(std::istream& in)
{
    io::LineReader reader(in);
    TileGraph graph;

    auto builderSection = io::ParseBuilderSection(reader, graph);
    if (!builderSection)
        return std::unexpected(std::move(builderSection.error()));

    if (auto blank = io::ParseBlankLine(reader); !blank)
        return std::unexpected(std::move(blank.error()));

    auto tiles = io::ParseTilesSection(reader, graph, builderSection->startTile);
    if (!tiles)
        return std::unexpected(std::move(tiles.error()));

    if (auto blank = io::ParseBlankLine(reader); !blank)
        return std::unexpected(std::move(blank.error()));

    if (auto exits = io::ParseExitsSection(reader, graph, *tiles); !exits)
        return std::unexpected(std::move(exits.error()));

    if (auto end = reader.ExpectEnd(); !end)
        return std::unexpected(std::move(end.error()));

    return Create(std::move(graph), builderSection->startTile, builderSection->start,
                  std::move(builderSection->builder));
}

Result<WorldMap> WorldMap::Load(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return IoError("Cannot open file: " + path.string() + " is a directory");

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return IoError("Cannot open file: " + path.string());

    spdlog::debug("loading world map {}", path.string());
    auto map = Load(in);
    if (!map) {
        spdlog::debug("rejected {}: {}", path.string(), map.error().Describe());
        return map;
    }

    spdlog::info("loaded world map {}: {} reachable of {} tiles, builder '{}'", path.string(),
                 map->tiles().size(), map->graph().size(), map->builder().name());
    return map;
}

} // namespace blockworld::world
