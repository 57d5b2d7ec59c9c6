// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_grammar.hpp"
#include "../utils.hpp"
namespace hermes {
namespace {

void
do_skip_blanks(const cow_string& str, size_t& pos) noexcept
  {
    while((pos < str.size()) && is_any_of(str[pos], {' ', '\t'}))
      pos ++;
  }

bool
do_match_token(cow_string& value, const cow_string& str, size_t& pos)
  {
    size_t bpos = pos;
    do_skip_blanks(str, bpos);

    size_t epos = bpos;
    while((epos < str.size()) && is_http_token_char(str[epos]))
      epos ++;

    if(epos == bpos)
      return false;

    value.assign(str.data() + bpos, epos - bpos);
    pos = epos;
    return true;
  }

size_t
do_match_lws(const cow_string& str, size_t pos) noexcept
  {
    // LWS = [CRLF] 1*( SP | HT )
    // A bare LF is accepted in place of CRLF.
    size_t epos = pos;
    if((epos < str.size()) && (str[epos] == '\r'))
      epos ++;
    if((epos < str.size()) && (str[epos] == '\n'))
      epos ++;
    else
      epos = pos;

    size_t wpos = epos;
    while((wpos < str.size()) && is_any_of(str[wpos], {' ', '\t'}))
      wpos ++;

    if(wpos == epos)
      return 0;

    return wpos - pos;
  }

bool
do_match_quoted_string(cow_string& value, const cow_string& str, size_t& pos, bool keep_quotes)
  {
    size_t bpos = pos;
    do_skip_blanks(str, bpos);

    if((bpos >= str.size()) || (str[bpos] != '"'))
      return false;

    size_t epos = bpos + 1;
    for(;;) {
      if(epos >= str.size())
        return false;

      if(str[epos] == '"')
        break;

      size_t nlws = do_match_lws(str, epos);
      if(nlws != 0) {
        epos += nlws;
        continue;
      }

      if(is_http_ctl(str[epos]))
        return false;

      epos ++;
    }

    // `epos` points to the closing quote.
    if(keep_quotes)
      value.assign(str.data() + bpos, epos + 1 - bpos);
    else
      value.assign(str.data() + bpos + 1, epos - bpos - 1);

    pos = epos + 1;
    return true;
  }

int
do_hex_digit_value(char ch) noexcept
  {
    if((ch >= '0') && (ch <= '9'))
      return ch - '0';
    else if((ch >= 'A') && (ch <= 'F'))
      return ch - 'A' + 10;
    else if((ch >= 'a') && (ch <= 'f'))
      return ch - 'a' + 10;
    else
      return -1;
  }

}  // namespace

opt<HTTP_Grammar_Match>
parse_token(const cow_string& str)
  {
    HTTP_Grammar_Match r;
    size_t pos = 0;
    if(!do_match_token(r.value, str, pos))
      return nullopt;

    r.tail.assign(str.data() + pos, str.size() - pos);
    return move(r);
  }

opt<HTTP_Grammar_Match>
parse_quoted_string(const cow_string& str, bool keep_quotes)
  {
    HTTP_Grammar_Match r;
    size_t pos = 0;
    if(!do_match_quoted_string(r.value, str, pos, keep_quotes))
      return nullopt;

    r.tail.assign(str.data() + pos, str.size() - pos);
    return move(r);
  }

opt<HTTP_Grammar_Match>
parse_word(const cow_string& str, bool keep_quotes)
  {
    auto result = parse_token(str);
    if(!result)
      result = parse_quoted_string(str, keep_quotes);
    return result;
  }

HTTP_Token_List
parse_token_list(const cow_string& str)
  {
    HTTP_Token_List result;
    cow_string key, value;
    size_t pos = 0;

    for(;;) {
      // If an element does not match, it shall be left intact, including the
      // comma before it.
      size_t elem_pos = pos;

      if(!result.items.empty()) {
        do_skip_blanks(str, pos);
        if((pos >= str.size()) || (str[pos] != ','))
          break;
        pos ++;
      }

      if(!do_match_token(key, str, pos)) {
        pos = elem_pos;
        break;
      }

      do_skip_blanks(str, pos);
      if((pos >= str.size()) || (str[pos] != '=')) {
        pos = elem_pos;
        break;
      }
      pos ++;

      if(!do_match_quoted_string(value, str, pos, false)) {
        pos = elem_pos;
        break;
      }

      result.items.emplace_back(move(key));
      result.items.emplace_back(move(value));
    }

    result.tail.assign(str.data() + pos, str.size() - pos);
    return result;
  }

HTTP_Attribute_List
parse_attributes(const cow_string& str, size_t max)
  {
    HTTP_Attribute_List result;
    cow_string key, value;
    size_t pos = 0;

    while(result.attributes.size() < max) {
      size_t elem_pos = pos;

      if(!do_match_token(key, str, pos))
        break;

      do_skip_blanks(str, pos);
      if((pos >= str.size()) || (str[pos] != '=')) {
        pos = elem_pos;
        break;
      }
      pos ++;

      if(!do_match_quoted_string(value, str, pos, false) && !do_match_token(value, str, pos)) {
        pos = elem_pos;
        break;
      }

      ascii_uppercase(key);
      result.attributes.emplace_back(move(key), move(value));

      // Consume an optional semicolon.
      size_t semi_pos = pos;
      do_skip_blanks(str, semi_pos);
      if((semi_pos < str.size()) && (str[semi_pos] == ';'))
        pos = semi_pos + 1;
    }

    result.tail.assign(str.data() + pos, str.size() - pos);
    return result;
  }

bool
hex_pattern_html(char ch) noexcept
  {
    return ((uint8_t) ch < '!') || ((uint8_t) ch > '~') || (ch == '"');
  }

bool
hex_pattern_url(char ch) noexcept
  {
    return !(((ch >= '0') && (ch <= '9'))
             || ((ch >= 'A') && (ch <= 'Z')) || ((ch >= 'a') && (ch <= 'z'))
             || (ch == '-') || (ch == '.') || (ch == '_') || (ch == '~'));
  }

bool
hex_pattern_all(char /*ch*/) noexcept
  {
    return true;
  }

cow_string
hexify(const cow_string& str, hex_pattern* pattern)
  {
    cow_string result;
    result.reserve(str.size());

    for(char ch : str)
      if(!pattern(ch))
        result.push_back(ch);
      else {
        // Encode this byte. Digits above nine are uppercase letters.
        char pct[3] = { '%', 0, 0 };
        for(uint32_t k = 1;  k != 3;  ++k) {
          int32_t dval = ((uint8_t) ch >> (8 - k * 4)) & 15;
          pct[k] = (char) (dval + '0' + ((9 - dval) >> 15 & 7));
        }
        result.append(pct, 3);
      }

    return result;
  }

cow_string
unhexify(const cow_string& str)
  {
    cow_string result;
    result.reserve(str.size());

    size_t pos = 0;
    while(pos < str.size()) {
      if((str[pos] == '%') && (str.size() - pos >= 3)) {
        int hi = do_hex_digit_value(str[pos + 1]);
        int lo = do_hex_digit_value(str[pos + 2]);
        if((hi >= 0) && (lo >= 0)) {
          result.push_back((char) (hi << 4 | lo));
          pos += 3;
          continue;
        }
      }

      // Copy this character verbatim.
      result.push_back(str[pos]);
      pos ++;
    }

    return result;
  }

}  // namespace hermes
