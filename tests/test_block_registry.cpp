// tests/test_block_registry.cpp

#include <doctest/doctest.h>

#include "blockworld/world/BlockRegistry.hpp"

using blockworld::world::BlockKind;
using blockworld::world::WorldError;

TEST_CASE("ResolveBlock maps every registered token")
{
    for (const BlockKind k : blockworld::world::kAllBlockKinds) {
        const auto b = blockworld::world::ResolveBlock(blockworld::world::BlockToken(k));
        REQUIRE(b.has_value());
        CHECK(b->kind == k);
    }
}

TEST_CASE("ResolveBlock rejects unknown and wrong-case tokens")
{
    for (const char* token : {"Wood", "WOOD", "gravel", "", " wood", "wood "}) {
        const auto b = blockworld::world::ResolveBlock(token);
        REQUIRE_FALSE(b.has_value());
        CHECK(b.error().code == WorldError::Code::Format);
    }
}

TEST_CASE("ResolveBlockList keeps order and treats the empty string as no blocks")
{
    const auto empty = blockworld::world::ResolveBlockList("");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    const auto list = blockworld::world::ResolveBlockList("soil,wood,stone,wood");
    REQUIRE(list.has_value());
    REQUIRE(list->size() == 4);
    CHECK((*list)[0].kind == BlockKind::Soil);
    CHECK((*list)[1].kind == BlockKind::Wood);
    CHECK((*list)[2].kind == BlockKind::Stone);
    CHECK((*list)[3].kind == BlockKind::Wood);
}

TEST_CASE("ResolveBlockList fails the whole list on any bad token")
{
    CHECK_FALSE(blockworld::world::ResolveBlockList("wood,glass").has_value());
    CHECK_FALSE(blockworld::world::ResolveBlockList("wood,").has_value());
    CHECK_FALSE(blockworld::world::ResolveBlockList(",wood").has_value());
    CHECK_FALSE(blockworld::world::ResolveBlockList("wood,,soil").has_value());
    CHECK_FALSE(blockworld::world::ResolveBlockList("wood, soil").has_value());
}

TEST_CASE("block capabilities")
{
    using blockworld::world::Block;

    CHECK(Block{BlockKind::Grass}.ground());
    CHECK(Block{BlockKind::Soil}.ground());
    CHECK_FALSE(Block{BlockKind::Wood}.ground());
    CHECK_FALSE(Block{BlockKind::Stone}.ground());

    CHECK(Block{BlockKind::Wood}.carryable());
    CHECK(Block{BlockKind::Soil}.carryable());
    CHECK_FALSE(Block{BlockKind::Grass}.carryable());
    CHECK_FALSE(Block{BlockKind::Stone}.carryable());

    CHECK_FALSE(Block{BlockKind::Stone}.diggable());
    CHECK(Block{BlockKind::Wood}.moveable());
    CHECK_FALSE(Block{BlockKind::Soil}.moveable());

    CHECK(Block{BlockKind::Stone}.colour() == "gray");
}
