// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <string_view>

namespace cpca::utils
{
/**
 * Strips leading and trailing unicode whitespace (including the
 * ideographic space U+3000 that is common in CJK text input).
 * Invalid UTF-8 bytes are never treated as whitespace.
 */
std::string trim(std::string_view text);

/**
 * Number of code points in a UTF-8 string. Each invalid byte
 * counts as one character.
 */
size_t char_count(std::string_view text);

/**
 * If text ends with the given suffix, returns text without it,
 * otherwise returns text unchanged. Operates on whole UTF-8
 * sequences, so a multi-byte suffix never splits a character.
 */
std::string_view strip_suffix(std::string_view text, std::string_view suffix);

}  // namespace cpca::utils
