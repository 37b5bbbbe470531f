#pragma once
// include/blockworld/actions/Actions.hpp
//
// Line-oriented action language applied to a loaded world:
//
//   MOVE_BUILDER <direction>
//   MOVE_BLOCK <direction>
//   DIG
//   DROP <inventory index>
//
// A line that is not one of these stops processing with an ActionFormatError.
// A well-formed action that breaks a block rule prints "Error: ..." and
// processing continues with the next line.

#include "blockworld/world/Error.hpp"
#include "blockworld/world/Position.hpp"
#include "blockworld/world/WorldMap.hpp"

#include <cstdint>
#include <expected>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace blockworld::actions {

struct ActionFormatError {
    int line = 0;
    std::string message;

    [[nodiscard]] std::string Describe() const;
};

struct Action {
    enum class Kind : std::uint8_t {
        MoveBuilder,
        MoveBlock,
        Dig,
        Drop,
    } kind{Kind::Dig};
    world::Direction direction{world::Direction::North}; // MoveBuilder, MoveBlock
    std::int32_t index = 0;                              // Drop
};

[[nodiscard]] std::expected<Action, ActionFormatError> ParseAction(std::string_view line);

// Applies one action and returns the message it prints.
[[nodiscard]] std::string ApplyAction(const Action& action, world::WorldMap& map);

[[nodiscard]] std::expected<void, ActionFormatError> ProcessActions(std::istream& in,
                                                                    world::WorldMap& map,
                                                                    std::ostream& out);

} // namespace blockworld::actions
