// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_field_name.hpp"
#include "http_grammar.hpp"
#include "../utils.hpp"
namespace hermes {

HTTP_Field_Name::
~HTTP_Field_Name()
  {
  }

bool
HTTP_Field_Name::
equals(chars_view other)
  const noexcept
  {
    return (this->m_str.size() == other.n)
           && (::rocket::ascii_ci_compare(this->m_str.data(), this->m_str.size(),
                                          other.p, other.n) == 0);
  }

size_t
HTTP_Field_Name::
rdhash()
  const noexcept
  {
    return ::rocket::ascii_ci_hash(this->m_str.data(), this->m_str.size());
  }

void
HTTP_Field_Name::
canonicalize()
  {
    if(this->m_str.empty())
      HERMES_THROW(("Empty HTTP field name"));

    bool word_start = true;
    for(size_t k = 0;  k != this->m_str.size();  ++k) {
      char ch = this->m_str[k];
      if(!is_http_token_char(ch))
        HERMES_THROW(("Invalid HTTP field name `$1`"), this->m_str);

      if(word_start && (ch >= 'a') && (ch <= 'z'))
        this->m_str.mut(k) = (char) (ch & 0xDF);
      else if(!word_start && (ch >= 'A') && (ch <= 'Z'))
        this->m_str.mut(k) = (char) (ch | 0x20);

      word_start = ch == '-';
    }
  }

}  // namespace hermes
