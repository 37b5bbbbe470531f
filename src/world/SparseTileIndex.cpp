// src/world/SparseTileIndex.cpp
#include "blockworld/world/SparseTileIndex.hpp"

#include <deque>
#include <string>

#include <spdlog/spdlog.h>

namespace blockworld::world {

namespace {

[[nodiscard]] std::string Describe(Position p)
{
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

} // namespace

Result<SparseTileIndex> SparseTileIndex::Build(const TileGraph& graph,
                                               TileId start,
                                               Position startPosition)
{
    BLOCKWORLD_ASSERT(graph.contains(start));

    SparseTileIndex index;
    index.m_byPosition.emplace(startPosition, start);
    index.m_byTile.emplace(start, startPosition);
    index.m_order.push_back(start);

    std::deque<TileId> open{start};
    while (!open.empty()) {
        const TileId current = open.front();
        open.pop_front();
        const Position here = index.m_byTile.at(current);

        for (const Direction d : kAllDirections) {
            const auto neighbour = graph.at(current).exit(d);
            if (!neighbour)
                continue;

            const auto implied = Step(here, d);
            if (!implied)
                return InconsistentError("exit " + std::string(DirectionName(d)) + " from " + Describe(here) +
                                         " leaves the coordinate range");

            if (const auto known = index.m_byTile.find(*neighbour); known != index.m_byTile.end()) {
                if (known->second != *implied)
                    return InconsistentError("tile at " + Describe(known->second) + " is also reached at " +
                                             Describe(*implied) + " going " + std::string(DirectionName(d)) +
                                             " from " + Describe(here));
                continue;
            }

            if (index.m_byPosition.contains(*implied))
                return InconsistentError("two tiles claim position " + Describe(*implied));

            index.m_byPosition.emplace(*implied, *neighbour);
            index.m_byTile.emplace(*neighbour, *implied);
            index.m_order.push_back(*neighbour);
            open.push_back(*neighbour);
        }
    }

    if (index.m_order.size() < graph.size())
        spdlog::debug("{} of {} tiles are unreachable from the start tile", graph.size() - index.m_order.size(),
                      graph.size());
    return index;
}

std::optional<TileId> SparseTileIndex::tileAt(Position p) const
{
    const auto it = m_byPosition.find(p);
    if (it == m_byPosition.end())
        return std::nullopt;
    return it->second;
}

std::optional<Position> SparseTileIndex::positionOf(TileId id) const
{
    const auto it = m_byTile.find(id);
    if (it == m_byTile.end())
        return std::nullopt;
    return it->second;
}

} // namespace blockworld::world
