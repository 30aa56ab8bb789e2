// SPDX-License-Identifier: Apache-2.0
#include <ansitok/EscapeScanner.h>

#include <catch2/catch.hpp>

#include <string_view>

using ansitok::ColorState;
using ansitok::scanCSI;
using ansitok::scanOSC;
using ansitok::TokenKind;
using namespace std::string_view_literals;

TEST_CASE("EscapeScanner.CSI.sgr", "[csi]")
{
    auto const token = scanCSI("\033[31mred"sv, ColorState {});
    CHECK(token.kind == TokenKind::EscapeCode);
    CHECK(token.content == "\033[31m");
    CHECK(token.foreground == "31");
    CHECK(token.background.empty());
}

TEST_CASE("EscapeScanner.CSI.cursor_movement_keeps_colors", "[csi]")
{
    auto const colors = ColorState { .foreground = "31"sv, .background = "44"sv };
    auto const token = scanCSI("\033[1Cworld"sv, colors);
    CHECK(token.content == "\033[1C");
    CHECK(token.colors() == colors);
}

TEST_CASE("EscapeScanner.CSI.private_and_intermediate_bytes", "[csi]")
{
    // DECTCEM with '?' leader.
    CHECK(scanCSI("\033[?25lX"sv, ColorState {}).content == "\033[?25l");

    // DECSCUSR with an intermediate space.
    CHECK(scanCSI("\033[2 qX"sv, ColorState {}).content == "\033[2 q");
}

TEST_CASE("EscapeScanner.CSI.sgr_with_intermediate_ignores_intermediates", "[csi]")
{
    auto const token = scanCSI("\033[31 m"sv, ColorState {});
    CHECK(token.content == "\033[31 m");
    CHECK(token.foreground == "31");
}

TEST_CASE("EscapeScanner.CSI.unterminated", "[csi]")
{
    auto const colors = ColorState { .foreground = "32"sv };

    SECTION("introducer only")
    {
        auto const token = scanCSI("\033["sv, colors);
        CHECK(token.content == "\033[");
        CHECK(token.colors() == colors);
    }

    SECTION("parameters without final byte")
    {
        auto const token = scanCSI("\033[31;4"sv, colors);
        CHECK(token.content == "\033[31;4");
        CHECK(token.colors() == colors);
    }

    SECTION("byte outside of the final byte range")
    {
        // LF is neither a parameter, intermediate nor final byte.
        auto const token = scanCSI("\033[31\nm"sv, colors);
        CHECK(token.content == "\033[31");
        CHECK(token.colors() == colors);
    }
}

TEST_CASE("EscapeScanner.CSI.empty_sgr_resets", "[csi]")
{
    auto const token = scanCSI("\033[m"sv, ColorState { .foreground = "31"sv, .background = "41"sv });
    CHECK(token.content == "\033[m");
    CHECK(token.colors() == ColorState {});
}

TEST_CASE("EscapeScanner.OSC.string_terminator", "[osc]")
{
    auto const token = scanOSC("\033]8;;http://x\033\\link"sv, ColorState {});
    CHECK(token.kind == TokenKind::EscapeCode);
    CHECK(token.content == "\033]8;;http://x\033\\");
}

TEST_CASE("EscapeScanner.OSC.bel", "[osc]")
{
    auto const colors = ColorState { .foreground = "33"sv };
    auto const token = scanOSC("\033]0;title\007rest"sv, colors);
    CHECK(token.content == "\033]0;title\007");
    CHECK(token.colors() == colors);
}

TEST_CASE("EscapeScanner.OSC.empty_payload", "[osc]")
{
    CHECK(scanOSC("\033]\033\\"sv, ColorState {}).content == "\033]\033\\");
    CHECK(scanOSC("\033]\007"sv, ColorState {}).content == "\033]\007");
}

TEST_CASE("EscapeScanner.OSC.unterminated", "[osc]")
{
    CHECK(scanOSC("\033]8;;http://x"sv, ColorState {}).content == "\033]8;;http://x");
    CHECK(scanOSC("\033]8;;\033"sv, ColorState {}).content == "\033]8;;\033");
}
