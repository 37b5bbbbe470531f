#pragma once
// include/blockworld/world/Block.hpp
//
// Closed set of block kinds that can be stacked on a tile.
// The token spelling is the one used by the world map file format.

#include <array>
#include <cstdint>
#include <string_view>

namespace blockworld::world {

enum class BlockKind : std::uint8_t {
    Wood = 0,
    Grass,
    Soil,
    Stone,
};

inline constexpr std::size_t kBlockKindCount = 4;

inline constexpr std::array<BlockKind, kBlockKindCount> kAllBlockKinds = {
    BlockKind::Wood, BlockKind::Grass, BlockKind::Soil, BlockKind::Stone,
};

[[nodiscard]] constexpr std::string_view BlockToken(BlockKind k) noexcept
{
    switch (k) {
    case BlockKind::Wood:  return "wood";
    case BlockKind::Grass: return "grass";
    case BlockKind::Soil:  return "soil";
    case BlockKind::Stone: return "stone";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view BlockColour(BlockKind k) noexcept
{
    switch (k) {
    case BlockKind::Wood:  return "brown";
    case BlockKind::Grass: return "green";
    case BlockKind::Soil:  return "black";
    case BlockKind::Stone: return "gray";
    }
    return "unknown";
}

// Ground blocks may only sit near the bottom of a stack.
[[nodiscard]] constexpr bool IsGround(BlockKind k) noexcept
{
    return k == BlockKind::Grass || k == BlockKind::Soil;
}

[[nodiscard]] constexpr bool IsCarryable(BlockKind k) noexcept
{
    return k == BlockKind::Wood || k == BlockKind::Soil;
}

[[nodiscard]] constexpr bool IsDiggable(BlockKind k) noexcept
{
    return k != BlockKind::Stone;
}

[[nodiscard]] constexpr bool IsMoveable(BlockKind k) noexcept
{
    return k == BlockKind::Wood;
}

struct Block {
    BlockKind kind{BlockKind::Wood};

    [[nodiscard]] constexpr std::string_view token() const noexcept { return BlockToken(kind); }
    [[nodiscard]] constexpr std::string_view colour() const noexcept { return BlockColour(kind); }
    [[nodiscard]] constexpr bool ground() const noexcept { return IsGround(kind); }
    [[nodiscard]] constexpr bool carryable() const noexcept { return IsCarryable(kind); }
    [[nodiscard]] constexpr bool diggable() const noexcept { return IsDiggable(kind); }
    [[nodiscard]] constexpr bool moveable() const noexcept { return IsMoveable(kind); }

    friend constexpr bool operator==(const Block&, const Block&) = default;
};

} // namespace blockworld::world
