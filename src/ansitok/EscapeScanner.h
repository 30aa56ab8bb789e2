// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ansitok/Token.h>

#include <string_view>

namespace ansitok
{

/// Scans a CSI sequence (ESC [ parameters* intermediates* final) at the front of @p input.
///
/// @p input must start with "ESC [". The returned EscapeCode token covers the
/// sequence up to and including its final byte, or up to the end of the input
/// if the sequence is unterminated. SGR sequences (final byte 'm') update the
/// given colors, all others pass them through unchanged.
[[nodiscard]] Token scanCSI(std::string_view input, ColorState colors);

/// Scans an OSC sequence (ESC ] ... BEL or ESC ] ... ESC \) at the front of @p input.
///
/// @p input must start with "ESC ]". The sequence ends after BEL, after the
/// string terminator, or at the end of the input. Colors pass through unchanged.
[[nodiscard]] Token scanOSC(std::string_view input, ColorState colors) noexcept;

} // namespace ansitok
