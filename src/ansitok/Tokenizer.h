// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ansitok/Token.h>

#include <cstddef>
#include <optional>
#include <string_view>

namespace ansitok
{

/// Resumable, single pass tokenizer over a string containing ANSI escape codes.
///
/// Each call to next() advances by exactly one token, which is then available
/// via token(). The color state is carried from one token to the next.
///
/// Multi-byte UTF-8 sequences are folded into plain text runs here; use
/// parseAll() to get them split into ComplexGlyph tokens.
///
/// @code
/// auto tokenizer = ansitok::Tokenizer(text);
/// while (tokenizer.next())
///     process(tokenizer.token());
/// @endcode
class Tokenizer
{
  public:
    explicit Tokenizer(std::string_view input) noexcept;

    /// Restarts tokenizing with the given input and empty colors.
    void reset(std::string_view input) noexcept;

    /// Parses the next token.
    ///
    /// @retval true a token was found and is available via token().
    /// @retval false the end of the input was reached.
    bool next();

    [[nodiscard]] Token const& token() const noexcept { return _token; }
    [[nodiscard]] std::string_view input() const noexcept { return _input; }
    [[nodiscard]] size_t position() const noexcept { return _position; }
    [[nodiscard]] ColorState colors() const noexcept { return _colors; }
    [[nodiscard]] bool done() const noexcept { return _state == State::Done; }

  private:
    enum class State
    {
        Scanning,
        Done,
    };

    bool emit(Token token);
    bool emitText(size_t start);

    std::string_view _input;
    size_t _position = 0;
    ColorState _colors {};
    Token _token {};
    State _state = State::Scanning;
};

/// Constructs a fresh tokenizer at the start of @p input with empty colors.
[[nodiscard]] inline Tokenizer resetCursor(std::string_view input) noexcept
{
    return Tokenizer(input);
}

/// Advances @p tokenizer by one token, or returns std::nullopt once the input is exhausted.
[[nodiscard]] std::optional<Token> tokenizeNext(Tokenizer& tokenizer);

} // namespace ansitok
