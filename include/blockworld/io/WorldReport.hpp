#pragma once
// include/blockworld/io/WorldReport.hpp
//
// JSON snapshot of a loaded world for inspection tools: the grid position,
// blocks and exits of every reachable tile. Write-only; maps are loaded from
// the text format.

#include "blockworld/world/Error.hpp"
#include "blockworld/world/WorldMap.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace blockworld::io {

namespace reportfmt {
inline constexpr const char* kFormat  = "BlockWorld.Report";
inline constexpr int         kVersion = 1;
} // namespace reportfmt

[[nodiscard]] nlohmann::json BuildWorldReport(const world::WorldMap& map);

[[nodiscard]] world::Result<void> WriteWorldReport(const world::WorldMap& map, const std::filesystem::path& path);

} // namespace blockworld::io
