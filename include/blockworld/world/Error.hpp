#pragma once
// include/blockworld/world/Error.hpp
//
// Error values returned across the world map boundary.
//
//   Format        - the text violates the map grammar (including user data that
//                   breaks a stacking rule or an unusable inventory block).
//   Inconsistent  - the text is well formed but the exits cannot be laid out
//                   on an integer grid.
//   Io            - the file could not be opened, read or written.

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#ifndef BLOCKWORLD_ASSERT
  #include <cassert>
  #define BLOCKWORLD_ASSERT(x) assert(x)
#endif

namespace blockworld::world {

struct WorldError {
    enum class Code : std::uint8_t {
        Format,
        Inconsistent,
        Io,
    } code{Code::Format};
    std::string message;
    int line = 0; // 1-based input line for format errors, 0 when not line-bound

    [[nodiscard]] std::string Describe() const;
};

[[nodiscard]] std::string_view CodeName(WorldError::Code c) noexcept;

template <typename T>
using Result = std::expected<T, WorldError>;

[[nodiscard]] inline std::unexpected<WorldError> FormatError(std::string message, int line = 0)
{
    return std::unexpected(WorldError{WorldError::Code::Format, std::move(message), line});
}

[[nodiscard]] inline std::unexpected<WorldError> InconsistentError(std::string message)
{
    return std::unexpected(WorldError{WorldError::Code::Inconsistent, std::move(message), 0});
}

[[nodiscard]] inline std::unexpected<WorldError> IoError(std::string message)
{
    return std::unexpected(WorldError{WorldError::Code::Io, std::move(message), 0});
}

// Outcome of a block-stacking rule (tile placement, digging, builder moves).
enum class BlockError : std::uint8_t {
    TooHigh,
    TooLow,
    InvalidBlock,
    NoExit,
};

[[nodiscard]] std::string_view BlockErrorName(BlockError e) noexcept;

} // namespace blockworld::world
