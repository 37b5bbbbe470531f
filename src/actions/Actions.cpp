// src/actions/Actions.cpp
#include "blockworld/actions/Actions.hpp"

#include "blockworld/io/LineGrammar.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace blockworld::actions {

namespace {

[[nodiscard]] std::vector<std::string_view> SplitSpaces(std::string_view s)
{
    std::vector<std::string_view> out;
    while (true) {
        const std::size_t pos = s.find(' ');
        if (pos == std::string_view::npos) {
            out.push_back(s);
            break;
        }
        out.push_back(s.substr(0, pos));
        s.remove_prefix(pos + 1);
    }
    return out;
}

[[nodiscard]] std::unexpected<ActionFormatError> Malformed(std::string message)
{
    return std::unexpected(ActionFormatError{0, std::move(message)});
}

[[nodiscard]] std::string Failure(world::BlockError e)
{
    return "Error: " + std::string(world::BlockErrorName(e));
}

} // namespace

std::string ActionFormatError::Describe() const
{
    std::string out = "action format error";
    if (line > 0)
        out += " (line " + std::to_string(line) + ")";
    if (!message.empty())
        out += ": " + message;
    return out;
}

std::expected<Action, ActionFormatError> ParseAction(std::string_view line)
{
    const auto parts = SplitSpaces(line);
    const std::string_view command = parts.front();

    if (command == "MOVE_BUILDER" || command == "MOVE_BLOCK") {
        if (parts.size() != 2)
            return Malformed(std::string(command) + " takes one direction");
        const auto dir = world::ParseDirection(parts[1]);
        if (!dir)
            return Malformed("unknown direction '" + std::string(parts[1]) + "'");

        Action a;
        a.kind = command == "MOVE_BUILDER" ? Action::Kind::MoveBuilder : Action::Kind::MoveBlock;
        a.direction = *dir;
        return a;
    }

    if (command == "DIG") {
        if (parts.size() != 1)
            return Malformed("DIG takes no arguments");
        return Action{Action::Kind::Dig};
    }

    if (command == "DROP") {
        if (parts.size() != 2)
            return Malformed("DROP takes one inventory index");
        const auto index = io::ParseInt(parts[1]);
        if (!index)
            return Malformed("bad inventory index '" + std::string(parts[1]) + "'");

        Action a;
        a.kind = Action::Kind::Drop;
        a.index = *index;
        return a;
    }

    return Malformed("unknown action '" + std::string(line) + "'");
}

std::string ApplyAction(const Action& action, world::WorldMap& map)
{
    const std::string dir(world::DirectionName(action.direction));

    switch (action.kind) {
    case Action::Kind::MoveBuilder:
        if (auto r = map.MoveBuilder(action.direction); !r)
            return Failure(r.error());
        return "Moved builder " + dir;

    case Action::Kind::MoveBlock:
        if (auto r = map.MoveBlock(action.direction); !r)
            return Failure(r.error());
        return "Moved block " + dir;

    case Action::Kind::Dig:
        if (auto r = map.Dig(); !r)
            return Failure(r.error());
        return "Top block on current tile removed";

    case Action::Kind::Drop:
        if (action.index < 0)
            return Failure(world::BlockError::InvalidBlock);
        if (auto r = map.Drop(static_cast<std::size_t>(action.index)); !r)
            return Failure(r.error());
        return "Dropped a block from inventory";
    }
    return "Error: Invalid action";
}

std::expected<void, ActionFormatError> ProcessActions(std::istream& in, world::WorldMap& map, std::ostream& out)
{
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        auto action = ParseAction(line);
        if (!action) {
            action.error().line = lineNo;
            return std::unexpected(std::move(action.error()));
        }

        const std::string message = ApplyAction(*action, map);
        spdlog::debug("action {}: {} -> {}", lineNo, line, message);
        out << message << '\n';
    }

    if (in.bad())
        return std::unexpected(ActionFormatError{lineNo + 1, "read failure"});
    return {};
}

} // namespace blockworld::actions
