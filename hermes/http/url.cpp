// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "url.hpp"
#include "../utils.hpp"
namespace hermes {
namespace {

uint16_t
do_default_port(const cow_string& scheme) noexcept
  {
    if(scheme == "https")
      return 443;

    return 80;
  }

void
do_assign_opt(cow_string& str, chars_view part)
  {
    if(part.p)
      str.assign(part.p, part.n);
  }

}  // namespace

bool
URL::
parse(chars_view str)
  {
    *this = URL();

    const char* bptr = str.p;
    const char* eptr = str.p + str.n;
    const char* mptr;

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    mptr = ::std::find_if_not(bptr, eptr,
      [](char c) {
        return ((c >= '0') && (c <= '9'))
               || ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
               || (c == '+') || (c == '-') || (c == '.');
      });

    if((mptr != bptr) && (mptr != eptr) && (*mptr == ':')
       && (((*bptr | 0x20) >= 'a') && ((*bptr | 0x20) <= 'z'))) {
      this->scheme.assign(bptr, (size_t) (mptr - bptr));
      ascii_lowercase(this->scheme);
      bptr = mptr + 1;
    }

    if((eptr - bptr >= 2) && (bptr[0] == '/') && (bptr[1] == '/')) {
      // Get the authority, which starts with an optional `userinfo@`.
      bptr += 2;
      mptr = ::std::find_if(bptr, eptr,
          [](char c) { return (c == '/') || (c == '?') || (c == '#');  });

      const char* aptr = mptr;
      while((aptr != bptr) && (aptr[-1] != '@'))
        aptr --;

      if(aptr != bptr) {
        this->userinfo.assign(bptr, (size_t) (aptr - 1 - bptr));
        bptr = aptr;
      }

      Network_Reference caddr;
      if(parse_network_reference(caddr, chars_view(bptr, (size_t) (eptr - bptr)))
            != (size_t) (eptr - bptr))
        return false;

      do_assign_opt(this->host, caddr.host);
      this->port = caddr.port_num;
      this->has_host = true;

      if(caddr.port.p && (caddr.port_num == 0))
        return false;

      do_assign_opt(this->path, caddr.path);
      do_assign_opt(this->query, caddr.query);
      this->has_query = caddr.query.p != nullptr;
      do_assign_opt(this->fragment, caddr.fragment);
      this->has_fragment = caddr.fragment.p != nullptr;
      return true;
    }

    // This is a relative reference, or has no authority.
    mptr = ::std::find_if(bptr, eptr, [](char c) { return (c == '?') || (c == '#');  });
    this->path.assign(bptr, (size_t) (mptr - bptr));
    bptr = mptr;

    if((bptr != eptr) && (*bptr == '?')) {
      mptr = ::std::find(bptr + 1, eptr, '#');
      this->query.assign(bptr + 1, (size_t) (mptr - bptr - 1));
      this->has_query = true;
      bptr = mptr;
    }

    if((bptr != eptr) && (*bptr == '#')) {
      this->fragment.assign(bptr + 1, (size_t) (eptr - bptr - 1));
      this->has_fragment = true;
    }

    return true;
  }

uint16_t
URL::
effective_port()
  const noexcept
  {
    if(this->port != 0)
      return this->port;

    return do_default_port(this->scheme);
  }

cow_string
URL::
local_part()
  const
  {
    cow_string result = this->path;
    if(result.empty())
      result = &"/";

    if(this->has_query) {
      result.push_back('?');
      result.append(this->query);
    }

    return result;
  }

cow_string
URL::
host_header()
  const
  {
    cow_string result;
    if(this->host.find(':') != cow_string::npos) {
      // IPv6 addresses are enclosed in brackets.
      result.push_back('[');
      result.append(this->host);
      result.push_back(']');
    }
    else
      result = this->host;

    if((this->port != 0) && (this->port != do_default_port(this->scheme))) {
      ::rocket::ascii_numput nump;
      nump.put_DU(this->port);
      result.push_back(':');
      result.append(nump.data(), nump.size());
    }

    return result;
  }

}  // namespace hermes
