// SPDX-License-Identifier: Apache-2.0
#include <ansitok/CharClass.h>
#include <ansitok/EscapeScanner.h>
#include <ansitok/Parser.h>
#include <ansitok/logging.h>

#include <libunicode/grapheme_segmenter.h>
#include <libunicode/utf8.h>

#include <utility>
#include <variant>

using std::string_view;
using std::vector;

namespace ansitok
{

namespace
{
    constexpr auto NoOffset = string_view::npos;
    constexpr auto ReplacementCharacter = char32_t { 0xFFFD };

    Token makeToken(TokenKind kind, string_view content, ColorState colors) noexcept
    {
        return Token {
            .kind = kind,
            .content = content,
            .foreground = colors.foreground,
            .background = colors.background,
        };
    }

    /// Common state of both passes: the output, the running colors and the
    /// pending plain text run.
    struct ParserState
    {
        string_view input;
        vector<Token>& tokens;
        ColorState colors {};
        size_t textStart = NoOffset;

        void emit(Token token)
        {
            if (tokenizerLog)
                tokenizerLog()("Parsed {}", token);
            tokens.emplace_back(token);
        }

        void beginText(size_t offset) noexcept
        {
            if (textStart == NoOffset)
                textStart = offset;
        }

        void flushText(size_t end)
        {
            if (textStart == NoOffset)
                return;
            if (end > textStart)
                emit(makeToken(TokenKind::PlainText, input.substr(textStart, end - textStart), colors));
            textStart = NoOffset;
        }

        /// Handles CSI, OSC and zero-width characters alike for both passes.
        ///
        /// @returns number of bytes consumed.
        size_t control(CharClass charClass, size_t offset)
        {
            flushText(offset);
            switch (charClass)
            {
                case CharClass::CsiStart:
                case CharClass::OscStart: {
                    auto const rest = input.substr(offset);
                    auto const token =
                        charClass == CharClass::CsiStart ? scanCSI(rest, colors) : scanOSC(rest, colors);
                    colors = token.colors();
                    emit(token);
                    return token.content.size();
                }
                case CharClass::ZeroWidth:
                    emit(makeToken(TokenKind::ZeroWidth, input.substr(offset, 1), colors));
                    return 1;
                case CharClass::MultiByte:
                case CharClass::Printable: break;
            }
            return 0;
        }
    };

    constexpr bool isControl(CharClass charClass) noexcept
    {
        return charClass == CharClass::CsiStart || charClass == CharClass::OscStart
               || charClass == CharClass::ZeroWidth;
    }

    /// Fast pass for the common case of pure US-ASCII input.
    ///
    /// Stops at the first non-ASCII byte and returns the offset the Unicode pass
    /// must continue from. The pending text run is left open for the Unicode
    /// pass. Its last byte is handed over to be scanned again, since it may be
    /// the base character of a grapheme cluster (e.g. "e" followed by a
    /// combining accent).
    size_t parseAscii(ParserState& state)
    {
        auto const input = state.input;
        auto i = size_t { 0 };
        while (i < input.size())
        {
            auto const charClass = classify(input, i);
            if (charClass == CharClass::MultiByte)
                return state.textStart != NoOffset ? i - 1 : i;

            if (isControl(charClass))
                i += state.control(charClass, i);
            else
            {
                state.beginText(i);
                ++i;
            }
        }
        state.flushText(i);
        return i;
    }

    /// Determines the byte length of the UTF-8 sequence at @p offset by its
    /// lead byte and trailing continuation bytes, and decodes it.
    ///
    /// Malformed sequences decode to U+FFFD but still consume at least one byte.
    std::pair<size_t, char32_t> decodeCodepoint(string_view input, size_t offset) noexcept
    {
        auto end = offset + 1;
        if (static_cast<uint8_t>(input[offset]) < 0x80)
            return { 1, static_cast<char32_t>(input[offset]) };

        while (end < input.size() && isContinuationByte(input[end]))
            ++end;

        auto decoderState = unicode::utf8_decoder_state {};
        auto result = unicode::ConvertResult { unicode::Incomplete {} };
        for (auto i = offset; i < end; ++i)
            result = unicode::from_utf8(decoderState, static_cast<uint8_t>(input[i]));

        auto const codepoint = std::holds_alternative<unicode::Success>(result)
                                   ? std::get<unicode::Success>(result).value
                                   : ReplacementCharacter;
        return { end - offset, codepoint };
    }

    constexpr bool isRegionalIndicator(char32_t codepoint) noexcept
    {
        return codepoint >= 0x1F1E6 && codepoint <= 0x1F1FF;
    }

    /// Unicode aware pass, segmenting text into grapheme clusters.
    ///
    /// Clusters made of US-ASCII only extend the current text run, all others
    /// become a ComplexGlyph token each.
    void parseUnicode(ParserState& state, size_t offset)
    {
        auto const input = state.input;
        auto clusterStart = NoOffset;
        auto clusterIsAscii = true;
        auto lastCodepoint = char32_t { 0 };
        // Number of regional indicators directly preceding the current codepoint.
        auto regionalIndicators = size_t { 0 };

        auto const finishCluster = [&](size_t end) {
            if (clusterStart == NoOffset)
                return;
            if (clusterIsAscii)
                state.beginText(clusterStart);
            else
            {
                state.flushText(clusterStart);
                state.emit(makeToken(TokenKind::ComplexGlyph,
                                     input.substr(clusterStart, end - clusterStart),
                                     state.colors));
            }
            clusterStart = NoOffset;
        };

        auto i = offset;
        while (i < input.size())
        {
            auto const charClass = classify(input, i);
            if (isControl(charClass))
            {
                finishCluster(i);
                i += state.control(charClass, i);
                lastCodepoint = 0;
                regionalIndicators = 0;
                continue;
            }

            auto const [length, codepoint] = decodeCodepoint(input, i);

            // NB: Skipping the segmenter for US-ASCII pairs is only an optimization.
            auto const isAsciiBreakable = lastCodepoint < 0x80 && codepoint < 0x80;

            // The pairwise segmenter cannot see how many regional indicators came
            // before, so flags (pairs of them) are counted here (GB12, GB13).
            auto const isFlagPair = isRegionalIndicator(lastCodepoint) && isRegionalIndicator(codepoint);

            auto const breakable = !lastCodepoint || isAsciiBreakable
                                   || (isFlagPair ? regionalIndicators % 2 == 0
                                                  : unicode::grapheme_segmenter::breakable(lastCodepoint, codepoint));
            if (breakable)
            {
                finishCluster(i);
                clusterStart = i;
                clusterIsAscii = true;
            }

            if (charClass == CharClass::MultiByte)
                clusterIsAscii = false;

            regionalIndicators = isRegionalIndicator(codepoint) ? regionalIndicators + 1 : 0;
            lastCodepoint = codepoint;
            i += length;
        }

        finishCluster(i);
        state.flushText(i);
    }
} // namespace

vector<Token> parseAll(string_view input, ParseStrategy strategy)
{
    auto tokens = vector<Token> {};
    auto state = ParserState { .input = input, .tokens = tokens };

    auto consumed = size_t { 0 };
    if (strategy == ParseStrategy::AsciiFastPath)
        consumed = parseAscii(state);

    if (consumed < input.size())
        parseUnicode(state, consumed);

    return tokens;
}

} // namespace ansitok
