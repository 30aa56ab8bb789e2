// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ansitok/Token.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace ansitok
{

enum class ParseStrategy : uint8_t
{
    /// Scans US-ASCII text with a fast byte-wise pass and only switches to
    /// grapheme cluster segmentation on the first non-ASCII byte.
    AsciiFastPath,
    /// Runs the Unicode aware pass over the whole input.
    UnicodeOnly,
};

/// Parses a string containing ANSI escape codes into its full token sequence.
///
/// Unlike Tokenizer, each user-perceived character made up of non-ASCII bytes
/// (including emoji joined by zero-width joiners) becomes its own ComplexGlyph
/// token. Both strategies yield identical tokens.
///
/// The returned tokens refer into @p input.
[[nodiscard]] std::vector<Token> parseAll(std::string_view input,
                                          ParseStrategy strategy = ParseStrategy::AsciiFastPath);

} // namespace ansitok
