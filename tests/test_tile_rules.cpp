// tests/test_tile_rules.cpp
//
// Stacking limits of a tile and the builder's construction contract.

#include <doctest/doctest.h>

#include "blockworld/world/Builder.hpp"
#include "blockworld/world/Tile.hpp"

#include <vector>

using blockworld::world::Block;
using blockworld::world::BlockError;
using blockworld::world::BlockKind;
using blockworld::world::Builder;
using blockworld::world::Direction;
using blockworld::world::Tile;
using blockworld::world::TileGraph;

namespace {

std::vector<Block> Repeat(BlockKind k, int n)
{
    return std::vector<Block>(static_cast<std::size_t>(n), Block{k});
}

} // namespace

TEST_CASE("a tile holds seven regular blocks but not eight")
{
    CHECK(Tile::FromBlocks(Repeat(BlockKind::Wood, 7)).has_value());

    const auto eight = Tile::FromBlocks(Repeat(BlockKind::Stone, 8));
    REQUIRE_FALSE(eight.has_value());
    CHECK(eight.error() == BlockError::TooHigh);
}

TEST_CASE("ground blocks only sit on fewer than two blocks")
{
    CHECK(Tile::FromBlocks(Repeat(BlockKind::Soil, 2)).has_value());

    const auto three = Tile::FromBlocks(Repeat(BlockKind::Soil, 3));
    REQUIRE_FALSE(three.has_value());
    CHECK(three.error() == BlockError::TooHigh);

    // Height, not the ground count, is what matters.
    const auto onWood = Tile::FromBlocks({Block{BlockKind::Wood}, Block{BlockKind::Wood}, Block{BlockKind::Grass}});
    CHECK_FALSE(onWood.has_value());

    // Regular blocks may go on top of ground blocks.
    CHECK(Tile::FromBlocks({Block{BlockKind::Grass}, Block{BlockKind::Soil}, Block{BlockKind::Wood}}).has_value());
}

TEST_CASE("Dig removes the top block unless it is stone")
{
    auto tile = Tile::FromBlocks({Block{BlockKind::Stone}, Block{BlockKind::Wood}});
    REQUIRE(tile.has_value());

    const auto dug = tile->Dig();
    REQUIRE(dug.has_value());
    CHECK(dug->kind == BlockKind::Wood);
    CHECK(tile->height() == 1);

    const auto stone = tile->Dig();
    REQUIRE_FALSE(stone.has_value());
    CHECK(stone.error() == BlockError::InvalidBlock);

    Tile empty;
    const auto none = empty.Dig();
    REQUIRE_FALSE(none.has_value());
    CHECK(none.error() == BlockError::TooLow);
}

TEST_CASE("exits are directed and not reciprocal")
{
    TileGraph graph;
    const auto a = graph.Add(Tile{});
    const auto b = graph.Add(Tile{});

    graph.AddExit(a, Direction::North, b);
    CHECK(graph.at(a).exit(Direction::North) == b);
    CHECK_FALSE(graph.at(b).exit(Direction::South).has_value());
    CHECK(graph.at(a).exitCount() == 1);

    graph.RemoveExit(a, Direction::North);
    CHECK(graph.at(a).exitCount() == 0);
}

TEST_CASE("Builder::Create rejects blocks that cannot be carried")
{
    TileGraph graph;
    const auto start = graph.Add(Tile{});

    const auto ok = Builder::Create("Steve", start, {Block{BlockKind::Wood}, Block{BlockKind::Soil}});
    REQUIRE(ok.has_value());
    CHECK(ok->name() == "Steve");
    CHECK(ok->inventory().size() == 2);
    CHECK(ok->currentTile() == start);

    const auto grass = Builder::Create("Steve", start, {Block{BlockKind::Grass}});
    REQUIRE_FALSE(grass.has_value());
    CHECK(grass.error() == BlockError::InvalidBlock);

    CHECK_FALSE(Builder::Create("Steve", start, {Block{BlockKind::Stone}}).has_value());
}

TEST_CASE("builder moves only through exits and over small height differences")
{
    TileGraph graph;
    const auto start = graph.Add(Tile{});
    auto tall = Tile::FromBlocks({Block{BlockKind::Wood}, Block{BlockKind::Wood}});
    REQUIRE(tall.has_value());
    const auto high = graph.Add(std::move(*tall));
    const auto flat = graph.Add(Tile{});

    graph.AddExit(start, Direction::North, high);
    graph.AddExit(start, Direction::East, flat);

    auto builder = Builder::Create("Steve", start, {});
    REQUIRE(builder.has_value());

    CHECK_FALSE(builder->CanEnter(graph, high));
    CHECK(builder->MoveTo(graph, Direction::North).error() == BlockError::NoExit);
    CHECK(builder->MoveTo(graph, Direction::West).error() == BlockError::NoExit);

    REQUIRE(builder->MoveTo(graph, Direction::East).has_value());
    CHECK(builder->currentTile() == flat);
}

TEST_CASE("MoveBlock moves a wooden top block onto a lower neighbour")
{
    TileGraph graph;
    auto source = Tile::FromBlocks({Block{BlockKind::Soil}, Block{BlockKind::Wood}});
    REQUIRE(source.has_value());
    const auto from = graph.Add(std::move(*source));
    const auto to = graph.Add(Tile{});
    graph.AddExit(from, Direction::West, to);

    CHECK(graph.MoveBlock(from, Direction::North).error() == BlockError::NoExit);

    REQUIRE(graph.MoveBlock(from, Direction::West).has_value());
    CHECK(graph.at(from).height() == 1);
    REQUIRE(graph.at(to).top().has_value());
    CHECK(graph.at(to).top()->kind == BlockKind::Wood);

    // Soil is not moveable.
    CHECK(graph.MoveBlock(from, Direction::West).error() == BlockError::InvalidBlock);
}
