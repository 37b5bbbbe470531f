// src/io/WorldReport.cpp
#include "blockworld/io/WorldReport.hpp"

#include "blockworld/io/AtomicFile.hpp"

#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace blockworld::io {

using json = nlohmann::json;
using world::TileId;

namespace {

[[nodiscard]] json BlockArray(const std::vector<world::Block>& blocks)
{
    json arr = json::array();
    for (const world::Block& b : blocks)
        arr.push_back(std::string(b.token()));
    return arr;
}

} // namespace

json BuildWorldReport(const world::WorldMap& map)
{
    const auto& order = map.tiles();
    std::unordered_map<TileId, std::size_t> reportId;
    for (std::size_t i = 0; i < order.size(); ++i)
        reportId.emplace(order[i], i);

    json j;
    j["format"] = reportfmt::kFormat;
    j["version"] = reportfmt::kVersion;
    j["start"] = { {"x", map.startPosition().x}, {"y", map.startPosition().y} };

    json builder = json::object();
    builder["name"] = map.builder().name();
    builder["inventory"] = BlockArray(map.builder().inventory());
    if (const auto it = reportId.find(map.builder().currentTile()); it != reportId.end())
        builder["tile"] = it->second;
    else
        builder["tile"] = nullptr;
    j["builder"] = std::move(builder);

    json tiles = json::array();
    for (std::size_t i = 0; i < order.size(); ++i) {
        const world::Tile& t = map.tile(order[i]);
        const auto pos = map.positionOf(order[i]);
        BLOCKWORLD_ASSERT(pos.has_value());

        json exits = json::object();
        for (const world::Direction d : world::kAllDirections) {
            if (const auto target = t.exit(d))
                exits[std::string(world::DirectionName(d))] = reportId.at(*target);
        }

        tiles.push_back({
            {"id", i},
            {"x", pos->x},
            {"y", pos->y},
            {"blocks", BlockArray(t.blocks())},
            {"exits", std::move(exits)},
        });
    }
    j["tiles"] = std::move(tiles);
    return j;
}

world::Result<void> WriteWorldReport(const world::WorldMap& map, const std::filesystem::path& path)
{
    std::string text;
    try {
        text = BuildWorldReport(map).dump(2);
    } catch (const json::exception& e) {
        // Builder names are not validated as UTF-8; dump() rejects invalid sequences.
        return world::IoError(std::string("report encoding failed: ") + e.what());
    }
    text.push_back('\n');

    std::string err;
    if (!write_atomic(path, text, &err))
        return world::IoError(err);

    spdlog::info("wrote world report {}", path.string());
    return {};
}

} // namespace blockworld::io
