// src/io/MapWriter.cpp
#include "blockworld/io/MapWriter.hpp"

#include "blockworld/io/AtomicFile.hpp"

#include <sstream>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace blockworld::io {

using world::Block;
using world::TileId;

namespace {

void WriteBlockList(std::ostream& out, const std::vector<Block>& blocks)
{
    bool first = true;
    for (const Block& b : blocks) {
        if (!first)
            out << ',';
        out << b.token();
        first = false;
    }
}

} // namespace

std::string FormatWorldMap(const world::WorldMap& map)
{
    const std::vector<TileId>& order = map.tiles();

    std::unordered_map<TileId, std::size_t> fileId;
    fileId.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i)
        fileId.emplace(order[i], i);

    std::ostringstream out;
    out << map.startPosition().x << '\n';
    out << map.startPosition().y << '\n';
    out << map.builder().name() << '\n';
    WriteBlockList(out, map.builder().inventory());
    out << "\n\n";

    out << "total:" << order.size() << '\n';
    for (std::size_t i = 0; i < order.size(); ++i) {
        out << i << ' ';
        WriteBlockList(out, map.tile(order[i]).blocks());
        out << '\n';
    }
    out << '\n';

    out << "exits\n";
    for (std::size_t i = 0; i < order.size(); ++i) {
        out << i << ' ';
        const world::Tile& t = map.tile(order[i]);
        bool first = true;
        for (const world::Direction d : world::kAllDirections) {
            const auto target = t.exit(d);
            if (!target)
                continue;
            // Every exit of a reachable tile leads to a reachable tile.
            const auto it = fileId.find(*target);
            BLOCKWORLD_ASSERT(it != fileId.end());
            if (!first)
                out << ',';
            out << world::DirectionName(d) << ':' << it->second;
            first = false;
        }
        out << '\n';
    }
    return out.str();
}

Result<void> SaveWorldMap(const world::WorldMap& map,
                          const std::filesystem::path& path,
                          const SaveOptions& options)
{
    const std::string text = FormatWorldMap(map);

    std::string err;
    const bool ok = options.atomic ? write_atomic(path, text, &err, options.makeBackup)
                                   : write_direct(path, text, &err);
    if (!ok) {
        spdlog::warn("saving {} failed: {}", path.string(), err);
        return world::IoError(err);
    }

    spdlog::info("saved world map {} ({} tiles)", path.string(), map.tiles().size());
    return {};
}

} // namespace blockworld::io
