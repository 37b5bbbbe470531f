#pragma once
// include/blockworld/io/LineGrammar.hpp
//
// Lexical primitives of the world map format. These are the only functions
// that interpret raw text; every failure is a Format WorldError.

#include "blockworld/world/Error.hpp"

#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <string>
#include <string_view>

namespace blockworld::io {

using world::Result;

// Line cursor over an input stream. Never yields a missing line: end of input
// and stream failures are errors.
class LineReader {
public:
    explicit LineReader(std::istream& in) noexcept : m_in(in) {}

    // Strips a trailing '\r' so CRLF files read the same as LF files.
    [[nodiscard]] Result<std::string> ReadLine();

    // Succeeds only when no further line can be read.
    [[nodiscard]] Result<void> ExpectEnd();

    // Number of lines consumed so far (the 1-based number of the last line read).
    [[nodiscard]] int line() const noexcept { return m_line; }

private:
    std::istream& m_in;
    int m_line = 0;
};

// Decimal int32 with an optional leading sign; no whitespace, nothing trailing.
[[nodiscard]] Result<std::int32_t> ParseInt(std::string_view token);

using LabeledCounts = std::map<std::string, std::int32_t, std::less<>>;

// "label:N,label:M" with [a-z]+ labels, N >= 0, no spaces and no repeated
// labels. "" yields an empty mapping (unless exactlyOne is set).
[[nodiscard]] Result<LabeledCounts> ParseLabeledCounts(std::string_view line, bool exactlyOne);

struct NumberedRow {
    std::int32_t id = 0;
    std::string rest; // empty when absent
};

// "<int>" or "<int> <rest>" where rest contains no space.
[[nodiscard]] Result<NumberedRow> ParseNumberedRow(std::string_view line);

// Attaches `line` to a format error that is not yet line-bound.
template <typename T>
[[nodiscard]] Result<T> AtLine(Result<T> r, int line)
{
    if (!r && r.error().line == 0)
        r.error().line = line;
    return r;
}

} // namespace blockworld::io
