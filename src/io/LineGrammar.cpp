// src/io/LineGrammar.cpp
#include "blockworld/io/LineGrammar.hpp"

#include <charconv>
#include <system_error>

namespace blockworld::io {

using world::FormatError;

namespace {

[[nodiscard]] bool IsLowerLabel(std::string_view s) noexcept
{
    if (s.empty())
        return false;
    for (const char c : s) {
        if (c < 'a' || c > 'z')
            return false;
    }
    return true;
}

[[nodiscard]] bool IsDigits(std::string_view s) noexcept
{
    if (s.empty())
        return false;
    for (const char c : s) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

[[nodiscard]] std::string Quote(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    out.append(s);
    out.push_back('\'');
    return out;
}

} // namespace

Result<std::string> LineReader::ReadLine()
{
    std::string line;
    if (!std::getline(m_in, line)) {
        if (m_in.bad())
            return FormatError("read failure", m_line + 1);
        return FormatError("unexpected end of input", m_line + 1);
    }
    ++m_line;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

Result<void> LineReader::ExpectEnd()
{
    std::string line;
    if (std::getline(m_in, line))
        return FormatError("unexpected content after exits section", m_line + 1);
    if (m_in.bad())
        return FormatError("read failure", m_line + 1);
    return {};
}

Result<std::int32_t> ParseInt(std::string_view token)
{
    std::string_view digits = token;
    bool negative = false;
    if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }
    if (!IsDigits(digits))
        return FormatError("not an integer: " + Quote(token));

    // Parse with the sign attached so INT32_MIN stays representable.
    std::string signedText;
    signedText.reserve(digits.size() + 1);
    if (negative)
        signedText.push_back('-');
    signedText.append(digits);

    std::int32_t value = 0;
    const char* begin = signedText.data();
    const char* end = begin + signedText.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range)
        return FormatError("integer out of range: " + Quote(token));
    if (ec != std::errc{} || ptr != end)
        return FormatError("not an integer: " + Quote(token));
    return value;
}

Result<LabeledCounts> ParseLabeledCounts(std::string_view line, bool exactlyOne)
{
    LabeledCounts out;
    if (line.empty()) {
        if (exactlyOne)
            return FormatError("expected exactly one label:number field");
        return out;
    }

    while (true) {
        const std::size_t comma = line.find(',');
        const std::string_view field = line.substr(0, comma);

        const std::size_t colon = field.find(':');
        if (colon == std::string_view::npos)
            return FormatError("expected label:number, got " + Quote(field));

        const std::string_view label = field.substr(0, colon);
        const std::string_view number = field.substr(colon + 1);
        if (!IsLowerLabel(label))
            return FormatError("bad label " + Quote(label));
        if (!IsDigits(number))
            return FormatError("bad count " + Quote(number) + " for " + Quote(label));

        auto value = ParseInt(number);
        if (!value)
            return std::unexpected(std::move(value.error()));

        if (!out.emplace(std::string(label), *value).second)
            return FormatError("repeated label " + Quote(label));

        if (comma == std::string_view::npos)
            break;
        line.remove_prefix(comma + 1);
    }

    if (exactlyOne && out.size() != 1)
        return FormatError("expected exactly one label:number field");
    return out;
}

Result<NumberedRow> ParseNumberedRow(std::string_view line)
{
    const std::size_t space = line.find(' ');
    const std::string_view head = line.substr(0, space);

    std::string_view rest;
    if (space != std::string_view::npos) {
        rest = line.substr(space + 1);
        if (rest.find(' ') != std::string_view::npos)
            return FormatError("more than one space in row " + Quote(line));
    }

    auto id = ParseInt(head);
    if (!id)
        return std::unexpected(std::move(id.error()));

    return NumberedRow{*id, std::string(rest)};
}

} // namespace blockworld::io
