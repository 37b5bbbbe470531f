#pragma once
// tests/test_support/SampleMaps.h
//
// Map texts shared across suites.

namespace blockworld::test {

// Three tiles around a start at (3, -2): tile 1 north of it, tile 2 east.
inline constexpr const char* kSimpleMap =
    "3\n"
    "-2\n"
    "Steve\n"
    "wood,soil\n"
    "\n"
    "total:3\n"
    "0 grass,soil\n"
    "1 wood\n"
    "2 stone,stone\n"
    "\n"
    "exits\n"
    "0 north:1,east:2\n"
    "1 south:0\n"
    "2 west:0\n";

// Same world with rows out of order and tile ids permuted.
inline constexpr const char* kShuffledMap =
    "3\n"
    "-2\n"
    "Steve\n"
    "wood,soil\n"
    "\n"
    "total:3\n"
    "2 wood\n"
    "0 grass,soil\n"
    "1 stone,stone\n"
    "\n"
    "exits\n"
    "1 west:0\n"
    "2 south:0\n"
    "0 east:1,north:2\n";

// Minimal one-tile world with an empty inventory.
inline constexpr const char* kSingleTileMap =
    "0\n"
    "0\n"
    "Alex\n"
    "\n"
    "\n"
    "total:1\n"
    "0\n"
    "\n"
    "exits\n"
    "0\n";

} // namespace blockworld::test
