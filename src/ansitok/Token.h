// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ansitok
{

enum class TokenKind : uint8_t
{
    /// A run of characters, each taking up exactly one cell on screen.
    PlainText,
    /// A CSI or OSC escape sequence.
    EscapeCode,
    /// A single printable character spanning more than one byte of input,
    /// such as a multi-byte codepoint or an emoji joined by zero-width joiners.
    ComplexGlyph,
    /// A zero-width control character (BEL).
    ZeroWidth,
};

/// Active foreground/background color, encoded as raw SGR parameter text
/// (e.g. "31", "38;5;208", "48;2;255;90;0"). An empty tag means no color is set.
///
/// Both tags refer into the tokenized input buffer.
struct ColorState
{
    std::string_view foreground {};
    std::string_view background {};

    constexpr bool operator==(ColorState const&) const noexcept = default;
};

/// A contiguous substring of the input, classified by kind and annotated with
/// the color state active after this token has taken effect.
///
/// Content and colors are views into the tokenized input, which therefore
/// must outlive the token.
struct Token
{
    TokenKind kind = TokenKind::PlainText;
    std::string_view content {};
    std::string_view foreground {};
    std::string_view background {};

    [[nodiscard]] constexpr ColorState colors() const noexcept { return { foreground, background }; }

    /// Tests whether the content consists of 7-bit US-ASCII only.
    [[nodiscard]] bool isAscii() const noexcept;

    constexpr bool operator==(Token const&) const noexcept = default;
};

/// Number of screen cells the token takes up when printed.
///
/// Plain text counts one cell per byte, a complex glyph one cell, and escape
/// codes as well as zero-width characters no cell at all.
[[nodiscard]] size_t printLength(Token const& token) noexcept;

/// Sums up the print length of all given tokens.
[[nodiscard]] size_t printLength(std::span<Token const> tokens) noexcept;

} // namespace ansitok

// {{{ fmt formatter
template <>
struct fmt::formatter<ansitok::TokenKind>: fmt::formatter<std::string_view>
{
    auto format(ansitok::TokenKind value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case ansitok::TokenKind::PlainText: name = "PlainText"; break;
            case ansitok::TokenKind::EscapeCode: name = "EscapeCode"; break;
            case ansitok::TokenKind::ComplexGlyph: name = "ComplexGlyph"; break;
            case ansitok::TokenKind::ZeroWidth: name = "ZeroWidth"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<ansitok::Token>: fmt::formatter<std::string>
{
    auto format(ansitok::Token const& token, format_context& ctx) const -> format_context::iterator;
};
// }}}
