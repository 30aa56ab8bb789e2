// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ansitok/Token.h>

#include <string_view>

namespace ansitok
{

/// Applies the parameters of an SGR sequence (the text between "ESC [" and the
/// final 'm', e.g. "1;93" or "38;2;0;63;255") to the given color state.
///
/// Fields are applied left to right, so later fields win. Unknown fields and
/// malformed extended colors are ignored. The returned tags are substrings of
/// @p parameters, so they share its lifetime.
[[nodiscard]] ColorState resolveSGR(std::string_view parameters, ColorState colors);

} // namespace ansitok
