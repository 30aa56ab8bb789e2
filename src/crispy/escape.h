// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace crispy
{

/// Renders a single byte the way it would be written in a C string literal.
inline std::string escape(uint8_t ch)
{
    switch (ch)
    {
        case '\\': return "\\\\";
        case 0x07: return "\\a";
        case 0x1B: return "\\e";
        case '\t': return "\\t";
        case '\r': return "\\r";
        case '\n': return "\\n";
        case '"': return "\\\"";
        default:
            if (0x20 <= ch && ch < 0x7F)
                return fmt::format("{}", static_cast<char>(ch));
            else
                return fmt::format("\\x{:02x}", static_cast<unsigned>(ch));
    }
}

inline std::string escape(std::string_view s)
{
    auto result = std::string {};
    result.reserve(s.size());
    for (char const ch: s)
        result += escape(static_cast<uint8_t>(ch));
    return result;
}

} // namespace crispy
