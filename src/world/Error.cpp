// src/world/Error.cpp
#include "blockworld/world/Error.hpp"

namespace blockworld::world {

std::string_view CodeName(WorldError::Code c) noexcept
{
    switch (c) {
    case WorldError::Code::Format:       return "format error";
    case WorldError::Code::Inconsistent: return "inconsistent map";
    case WorldError::Code::Io:           return "i/o error";
    }
    return "error";
}

std::string WorldError::Describe() const
{
    std::string out(CodeName(code));
    if (line > 0) {
        out += " (line ";
        out += std::to_string(line);
        out += ")";
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

std::string_view BlockErrorName(BlockError e) noexcept
{
    switch (e) {
    case BlockError::TooHigh:      return "Too high";
    case BlockError::TooLow:       return "Too low";
    case BlockError::InvalidBlock: return "Cannot use that block";
    case BlockError::NoExit:       return "No exit this way";
    }
    return "Invalid action";
}

} // namespace blockworld::world
