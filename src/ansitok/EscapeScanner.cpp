// SPDX-License-Identifier: Apache-2.0
#include <ansitok/CharClass.h>
#include <ansitok/EscapeScanner.h>
#include <ansitok/SgrResolver.h>

#include <cassert>

using std::string_view;

namespace ansitok
{

namespace
{
    constexpr size_t IntroducerLength = 2;

    constexpr bool isParameterByte(char ch) noexcept
    {
        return ch >= 0x30 && ch <= 0x3F;
    }

    constexpr bool isIntermediateByte(char ch) noexcept
    {
        return ch >= 0x20 && ch <= 0x2F;
    }

    constexpr bool isFinalByte(char ch) noexcept
    {
        return ch >= 0x40 && ch <= 0x7E;
    }

    Token makeEscapeCode(string_view content, ColorState colors) noexcept
    {
        return Token {
            .kind = TokenKind::EscapeCode,
            .content = content,
            .foreground = colors.foreground,
            .background = colors.background,
        };
    }
} // namespace

Token scanCSI(string_view input, ColorState colors)
{
    assert(input.size() >= IntroducerLength);
    assert(input[0] == ControlCode::ESC && input[1] == ControlCode::CSI);

    auto i = IntroducerLength;

    while (i < input.size() && isParameterByte(input[i]))
        ++i;
    auto const parameters = input.substr(IntroducerLength, i - IntroducerLength);

    while (i < input.size() && isIntermediateByte(input[i]))
        ++i;

    auto finalByte = '\0';
    if (i < input.size() && isFinalByte(input[i]))
        finalByte = input[i++];

    if (finalByte == 'm')
        colors = resolveSGR(parameters, colors);

    return makeEscapeCode(input.substr(0, i), colors);
}

Token scanOSC(string_view input, ColorState colors) noexcept
{
    assert(input.size() >= IntroducerLength);
    assert(input[0] == ControlCode::ESC && input[1] == ControlCode::OSC);

    auto i = IntroducerLength;
    while (i < input.size())
    {
        if (input[i] == ControlCode::BEL)
        {
            ++i;
            break;
        }
        if (input[i] == ControlCode::ESC && i + 1 < input.size() && input[i + 1] == ControlCode::ST)
        {
            i += 2;
            break;
        }
        ++i;
    }

    return makeEscapeCode(input.substr(0, i), colors);
}

} // namespace ansitok
