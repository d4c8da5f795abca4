// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "utf8.h"

#include <boost/locale/utf.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace cpca::utils
{
namespace utf = boost::locale::utf;

static bool is_whitespace(utf::code_point c)
{
  switch (c) {
    case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
    case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

std::string trim(std::string_view text)
{
  auto it = text.begin();
  auto first = text.end();
  auto last = text.begin();

  while (it != text.end()) {
    auto start = it;
    auto c = utf::utf_traits<char>::decode(it, text.end());
    if (c == utf::illegal || c == utf::incomplete) {
      // decode may stop without consuming anything on a broken
      // trailing sequence, skip the offending byte ourselves.
      it = std::next(start);
    } else if (is_whitespace(c)) {
      continue;
    }
    if (first == text.end()) {
      first = start;
    }
    last = it;
  }

  if (first == text.end()) {
    return std::string();
  }
  return std::string(first, last);
}

size_t char_count(std::string_view text)
{
  size_t count = 0;
  auto it = text.begin();
  while (it != text.end()) {
    auto start = it;
    auto c = utf::utf_traits<char>::decode(it, text.end());
    if (c == utf::illegal || c == utf::incomplete) {
      it = std::next(start);
    }
    ++count;
  }
  return count;
}

std::string_view strip_suffix(std::string_view text, std::string_view suffix)
{
  if (!suffix.empty() && boost::algorithm::ends_with(text, suffix)) {
    text.remove_suffix(suffix.size());
  }
  return text;
}

}  // namespace cpca::utils
