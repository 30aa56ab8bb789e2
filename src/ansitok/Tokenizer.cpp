// SPDX-License-Identifier: Apache-2.0
#include <ansitok/CharClass.h>
#include <ansitok/EscapeScanner.h>
#include <ansitok/Tokenizer.h>
#include <ansitok/logging.h>

using std::optional;
using std::string_view;

namespace ansitok
{

Tokenizer::Tokenizer(string_view input) noexcept: _input { input }
{
}

void Tokenizer::reset(string_view input) noexcept
{
    _input = input;
    _position = 0;
    _colors = ColorState {};
    _token = Token {};
    _state = State::Scanning;
}

bool Tokenizer::next()
{
    if (_state == State::Done)
        return false;

    // Start of the plain text run we may be reading.
    auto const start = _position;

    while (_position < _input.size())
    {
        auto const charClass = classify(_input, _position);
        switch (charClass)
        {
            case CharClass::MultiByte:
                // Lead byte and its continuation bytes all start with a 1 bit.
                ++_position;
                while (_position < _input.size() && isContinuationByte(_input[_position]))
                    ++_position;
                break;
            case CharClass::CsiStart:
            case CharClass::OscStart: {
                if (_position != start)
                    return emitText(start);

                auto const rest = _input.substr(_position);
                auto const token =
                    charClass == CharClass::CsiStart ? scanCSI(rest, _colors) : scanOSC(rest, _colors);
                _colors = token.colors();
                _position += token.content.size();
                return emit(token);
            }
            case CharClass::ZeroWidth:
                if (_position != start)
                    return emitText(start);

                ++_position;
                return emit(Token {
                    .kind = TokenKind::ZeroWidth,
                    .content = _input.substr(start, 1),
                    .foreground = _colors.foreground,
                    .background = _colors.background,
                });
            case CharClass::Printable: ++_position; break;
        }
    }

    _state = State::Done;

    if (_position != start)
        return emitText(start);

    return false;
}

bool Tokenizer::emitText(size_t start)
{
    return emit(Token {
        .kind = TokenKind::PlainText,
        .content = _input.substr(start, _position - start),
        .foreground = _colors.foreground,
        .background = _colors.background,
    });
}

bool Tokenizer::emit(Token token)
{
    _token = token;
    if (tokenizerLog)
        tokenizerLog()("Tokenizer at {}: {}", _position, _token);
    return true;
}

optional<Token> tokenizeNext(Tokenizer& tokenizer)
{
    if (!tokenizer.next())
        return std::nullopt;
    return tokenizer.token();
}

} // namespace ansitok
