// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_HTTP_GRAMMAR_
#define HERMES_HTTP_HTTP_GRAMMAR_

#include "../fwd.hpp"
namespace hermes {

// These are character classes from RFC 822 and RFC 2616. CTLs are 0x00-0x1F
// and 0x7F. Tspecials are `()<>@,;:\"/[]?={}`, space and horizontal tab.
constexpr
bool
is_http_ctl(char ch) noexcept
  {
    return ((uint8_t) ch <= 0x1F) || ((uint8_t) ch == 0x7F);
  }

constexpr
bool
is_http_tspecial(char ch) noexcept
  {
    switch(ch)
      {
      case '(': case ')': case '<': case '>': case '@':
      case ',': case ';': case ':': case '\\': case '"':
      case '/': case '[': case ']': case '?': case '=':
      case '{': case '}': case ' ': case '\t':
        return true;

      default:
        return false;
      }
  }

constexpr
bool
is_http_token_char(char ch) noexcept
  {
    return !is_http_ctl(ch) && !is_http_tspecial(ch);
  }

// Each parser below skips leading spaces and tabs, then matches a prefix of
// `str`. On success, the matched value and everything after it are returned.
// Whitespace after the match is not consumed. A mismatch yields `nullopt`.
struct HTTP_Grammar_Match
  {
    cow_string value;
    cow_string tail;
  };

// token = 1*<any CHAR except CTLs or tspecials>
opt<HTTP_Grammar_Match>
parse_token(const cow_string& str);

// quoted-string = ( <"> *(qdtext) <"> )
// qdtext = <any TEXT except <">>, where linear whitespace may be folded
// across lines. Backslashes have no special meaning. Quotes are stripped
// unless `keep_quotes` is set. Folding sequences are kept verbatim.
opt<HTTP_Grammar_Match>
parse_quoted_string(const cow_string& str, bool keep_quotes = false);

// word = token | quoted-string
opt<HTTP_Grammar_Match>
parse_word(const cow_string& str, bool keep_quotes = false);

// Parses a comma-separated list of `token = quoted-string` pairs, such as
// `a="1", b="2"`, into `[ a, 1, b, 2 ]`. Parsing stops at the first element
// that does not match; the element, including its leading comma, is left in
// `tail`. This function never fails.
struct HTTP_Token_List
  {
    cow_vector<cow_string> items;
    cow_string tail;
  };

HTTP_Token_List
parse_token_list(const cow_string& str);

// Parses `token = (quoted-string | token)` pairs separated by optional
// semicolons, such as the parameters in `text/html; charset="utf-8"`. At most
// `max` pairs are parsed. Names are converted to uppercase. Values are
// unquoted. This function never fails.
struct HTTP_Attribute_List
  {
    cow_bivector<cow_string, cow_string> attributes;
    cow_string tail;
  };

HTTP_Attribute_List
parse_attributes(const cow_string& str, size_t max = SIZE_MAX);

// A pattern for `hexify()` selects bytes to escape.
using hex_pattern = bool (char);

// every byte outside `!`..`~`, and `"`
bool
hex_pattern_html(char ch) noexcept;

// every byte other than `A-Z a-z 0-9 - . _ ~`
bool
hex_pattern_url(char ch) noexcept;

// every byte
bool
hex_pattern_all(char ch) noexcept;

// Replaces each byte that matches `pattern` with `%XX`, where `XX` is its
// value in uppercase hexadecimal.
cow_string
hexify(const cow_string& str, hex_pattern* pattern);

// Replaces each `%XX` with the byte it denotes. Both cases of hexadecimal
// digits are accepted. A `%` that is not followed by two hexadecimal digits
// is copied verbatim.
cow_string
unhexify(const cow_string& str);

// Encodes a string for `application/x-www-form-urlencoded` data. Spaces are
// encoded as `%20`, not `+`.
inline
cow_string
url_encode(const cow_string& str)
  {
    return hexify(str, hex_pattern_url);
  }

}  // namespace hermes
#endif
