// SPDX-License-Identifier: Apache-2.0
#include <ansitok/CharClass.h>
#include <ansitok/Token.h>

#include <crispy/escape.h>

#include <numeric>

namespace ansitok
{

bool Token::isAscii() const noexcept
{
    return ansitok::isAscii(content);
}

size_t printLength(Token const& token) noexcept
{
    switch (token.kind)
    {
        case TokenKind::PlainText: return token.content.size();
        case TokenKind::ComplexGlyph: return 1;
        case TokenKind::EscapeCode:
        case TokenKind::ZeroWidth: return 0;
    }
    return 0;
}

size_t printLength(std::span<Token const> tokens) noexcept
{
    return std::accumulate(tokens.begin(), tokens.end(), size_t { 0 }, [](size_t sum, Token const& token) {
        return sum + printLength(token);
    });
}

} // namespace ansitok

auto fmt::formatter<ansitok::Token>::format(ansitok::Token const& token, format_context& ctx) const
    -> format_context::iterator
{
    return formatter<std::string>::format(fmt::format("{}(\"{}\", fg=\"{}\", bg=\"{}\")",
                                                      token.kind,
                                                      crispy::escape(token.content),
                                                      token.foreground,
                                                      token.background),
                                          ctx);
}
