// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "rfc822_headers.hpp"
#include "http_grammar.hpp"
#include "../utils.hpp"
namespace hermes {

RFC822_Headers::
RFC822_Headers() noexcept
  {
  }

RFC822_Headers::
~RFC822_Headers()
  {
  }

void
RFC822_Headers::
add(const cow_string& name, const cow_string& value)
  {
    HTTP_Field_Name cname(name);
    cname.canonicalize();
    this->m_fields.emplace_back(move(cname), value);
  }

void
RFC822_Headers::
supersede(const cow_string& name, const cow_string& value)
  {
    HTTP_Field_Name cname(name);
    cname.canonicalize();

    size_t k = 0;
    while((k != this->m_fields.size()) && (this->m_fields[k].first != cname))
      k ++;

    if(k == this->m_fields.size()) {
      this->m_fields.emplace_back(move(cname), value);
      return;
    }

    // Replace the first field, then remove the others.
    auto& first = this->m_fields.mut(k);
    first.first = move(cname);
    first.second = value;

    size_t t = k + 1;
    while(t != this->m_fields.size())
      if(this->m_fields[t].first == first.first)
        this->m_fields.erase(t, 1);
      else
        t ++;
  }

size_t
RFC822_Headers::
erase(chars_view name)
  {
    size_t count = 0;
    size_t t = 0;
    while(t != this->m_fields.size())
      if(this->m_fields[t].first == name) {
        this->m_fields.erase(t, 1);
        count ++;
      }
      else
        t ++;
    return count;
  }

const cow_string*
RFC822_Headers::
find_opt(chars_view name)
  const noexcept
  {
    for(const auto& r : this->m_fields)
      if(r.first == name)
        return &(r.second);
    return nullptr;
  }

size_t
RFC822_Headers::
count(chars_view name)
  const noexcept
  {
    size_t count = 0;
    for(const auto& r : this->m_fields)
      count += r.first == name;
    return count;
  }

void
RFC822_Headers::
merge(const RFC822_Headers& other)
  {
    if(&other == this)
      return;

    for(size_t k = 0;  k != other.m_fields.size();  ++k) {
      const auto& r = other.m_fields[k];

      // Is this the first field with this name?
      size_t t = 0;
      while(other.m_fields[t].first != r.first)
        t ++;

      if(t == k)
        this->supersede(r.first.str(), r.second);
      else
        this->add(r.first.str(), r.second);
    }
  }

bool
RFC822_Headers::
push_line(const cow_string& line)
  {
    if(line.empty())
      return false;

    if(is_any_of(line[0], {' ', '\t'})) {
      // This is a continuation line. Unfolding removes the line break, but
      // the leading whitespace is kept.
      if(this->m_fields.empty())
        return false;

      size_t epos = line.rfind_not_of(" \t\r");
      if(epos == cow_string::npos)
        return true;

      this->m_fields.mut_back().second.append(line.data(), epos + 1);
      return true;
    }

    size_t colon = line.find(':');
    if(colon == cow_string::npos) {
      HERMES_LOG_DEBUG(("Header line has no colon: $1"), line);
      return false;
    }

    // The name must be a token without surrounding whitespace.
    HTTP_Field_Name cname(cow_string(line.data(), colon));
    if(cname.empty() || !::std::all_of(line.begin(), line.begin() + (ptrdiff_t) colon, is_http_token_char)) {
      HERMES_LOG_DEBUG(("Invalid header name: $1"), line);
      return false;
    }

    cname.canonicalize();

    // Strip leading and trailing whitespace from the value.
    cow_string value;
    size_t bpos = line.find_not_of(colon + 1, " \t");
    if(bpos != cow_string::npos) {
      size_t epos = line.rfind_not_of(" \t\r");
      value.assign(line.data() + bpos, epos + 1 - bpos);
    }

    this->m_fields.emplace_back(move(cname), move(value));
    return true;
  }

size_t
RFC822_Headers::
parse(chars_view text)
  {
    size_t nbad = 0;
    const char* bptr = text.p;
    const char* eptr = text.p + text.n;

    while(bptr != eptr) {
      const char* lptr = ::std::find(bptr, eptr, '\n');
      cow_string line(bptr, (size_t) (lptr - bptr));
      if(!line.empty() && (line.back() == '\r'))
        line.pop_back();

      bptr = lptr + (lptr != eptr);
      if(line.empty())
        continue;

      if(!this->push_line(line))
        nbad ++;
    }

    return nbad;
  }

void
RFC822_Headers::
encode(tinyfmt& fmt)
  const
  {
    for(const auto& r : this->m_fields) {
      fmt << r.first << ": ";

      const cow_string& value = r.second;
      for(size_t k = 0;  k != value.size();  ++k) {
        char ch = value[k];
        if(ch == '\r') {
          // A bare CR is not allowed.
          if((k + 1 == value.size()) || (value[k + 1] != '\n'))
            fmt.putc(' ');
          continue;
        }

        if(ch != '\n') {
          fmt.putc(ch);
          continue;
        }

        // Fold this line. A continuation line must start with whitespace.
        fmt.putn("\r\n", 2);
        if((k + 1 == value.size()) || is_none_of(value[k + 1], {' ', '\t'}))
          fmt.putc('\t');
      }

      fmt.putn("\r\n", 2);
    }
  }

}  // namespace hermes
