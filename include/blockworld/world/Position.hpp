#pragma once
// include/blockworld/world/Position.hpp
//
// Integer grid coordinates and the four compass directions that link tiles.
//
// Axis convention (shared by the consistency engine and the serializer):
//   north = y + 1, south = y - 1, east = x + 1, west = x - 1.

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>

namespace blockworld::world {

struct Position {
    std::int32_t x{0};
    std::int32_t y{0};

    friend constexpr bool operator==(const Position&, const Position&) = default;
};

struct PositionHash {
    [[nodiscard]] std::size_t operator()(const Position& p) const noexcept
    {
        const auto ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.x));
        const auto uy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.y));
        return std::hash<std::uint64_t>{}((ux << 32) | uy);
    }
};

enum class Direction : std::uint8_t {
    North = 0,
    East,
    South,
    West,
};

inline constexpr std::size_t kDirectionCount = 4;

// Fixed visiting order: traversal and serialization both iterate this.
inline constexpr std::array<Direction, kDirectionCount> kAllDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West,
};

[[nodiscard]] constexpr std::size_t DirectionIndex(Direction d) noexcept
{
    return static_cast<std::size_t>(d);
}

[[nodiscard]] constexpr std::string_view DirectionName(Direction d) noexcept
{
    switch (d) {
    case Direction::North: return "north";
    case Direction::East:  return "east";
    case Direction::South: return "south";
    case Direction::West:  return "west";
    }
    return "unknown";
}

// Case-sensitive: "North" is not a direction.
[[nodiscard]] constexpr std::optional<Direction> ParseDirection(std::string_view s) noexcept
{
    for (const Direction d : kAllDirections) {
        if (DirectionName(d) == s)
            return d;
    }
    return std::nullopt;
}

// Neighbouring cell, or nullopt when the step leaves the int32 grid.
[[nodiscard]] constexpr std::optional<Position> Step(Position p, Direction d) noexcept
{
    constexpr std::int32_t kMax = std::numeric_limits<std::int32_t>::max();
    constexpr std::int32_t kMin = std::numeric_limits<std::int32_t>::min();
    switch (d) {
    case Direction::North:
        if (p.y == kMax) return std::nullopt;
        return Position{p.x, p.y + 1};
    case Direction::East:
        if (p.x == kMax) return std::nullopt;
        return Position{p.x + 1, p.y};
    case Direction::South:
        if (p.y == kMin) return std::nullopt;
        return Position{p.x, p.y - 1};
    case Direction::West:
        if (p.x == kMin) return std::nullopt;
        return Position{p.x - 1, p.y};
    }
    return std::nullopt;
}

static_assert(*Step(Position{0, 0}, Direction::North) == Position{0, 1});
static_assert(*Step(Position{0, 0}, Direction::West) == Position{-1, 0});
static_assert(!Step(Position{0, std::numeric_limits<std::int32_t>::max()}, Direction::North).has_value());
static_assert(ParseDirection("east") == Direction::East);
static_assert(!ParseDirection("East").has_value());

} // namespace blockworld::world
