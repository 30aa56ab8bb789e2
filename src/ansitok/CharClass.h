// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ansitok
{

namespace ControlCode
{
    constexpr char BEL = 0x07; //!< Bell, Alert
    constexpr char ESC = 0x1B; //!< Escape
    constexpr char CSI = '[';  //!< Control Sequence Introducer (7-bit, after ESC)
    constexpr char OSC = ']';  //!< Operating System Command (7-bit, after ESC)
    constexpr char ST = '\\';  //!< String Terminator (7-bit, after ESC)
} // namespace ControlCode

enum class CharClass : uint8_t
{
    CsiStart,  //!< ESC [
    OscStart,  //!< ESC ]
    ZeroWidth, //!< BEL
    MultiByte, //!< any byte outside of US-ASCII
    Printable, //!< everything else
};

/// Classifies the byte at @p pos, looking ahead at most one byte.
///
/// An ESC that is neither followed by '[' nor ']' (including a trailing ESC at
/// the very end of the input) is treated as printable text.
constexpr CharClass classify(std::string_view input, size_t pos) noexcept
{
    auto const ch = static_cast<uint8_t>(input[pos]);
    if (ch >= 0x80)
        return CharClass::MultiByte;

    if (ch == ControlCode::BEL)
        return CharClass::ZeroWidth;

    if (ch == ControlCode::ESC && pos + 1 < input.size())
    {
        if (input[pos + 1] == ControlCode::CSI)
            return CharClass::CsiStart;
        if (input[pos + 1] == ControlCode::OSC)
            return CharClass::OscStart;
    }

    return CharClass::Printable;
}

/// UTF-8 continuation bytes carry the bit pattern 10xxxxxx.
constexpr bool isContinuationByte(char ch) noexcept
{
    return (static_cast<uint8_t>(ch) & 0xC0) == 0x80;
}

constexpr bool isAscii(std::string_view text) noexcept
{
    for (char const ch: text)
        if (static_cast<uint8_t>(ch) >= 0x80)
            return false;
    return true;
}

} // namespace ansitok
