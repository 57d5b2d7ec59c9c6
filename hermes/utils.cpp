// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "xprecompiled.hpp"
#include "utils.hpp"
#include "static/logger.hpp"
#include <algorithm>
#define UNW_LOCAL_ONLY  1
#include <libunwind.h>
namespace hermes {

bool
do_is_log_enabled(uint8_t level)
  noexcept
  {
    return logger.enabled(level);
  }

bool
do_push_log_message(uint8_t level, const char* func, const char* file, uint32_t line,
                    void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    cow_string sbuf = fmt.extract_string();
    sbuf.erase(sbuf.rfind_not_of(" \t\r\n") + 1);

    // Write the message.
    logger.write(level, func, file, line, sbuf);
    return true;
  }

::std::runtime_error
do_create_runtime_error(const char* func, const char* file, uint32_t line,
                        void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    ::std::string sbuf(fmt.c_str(), fmt.length());
    sbuf.erase(sbuf.find_last_not_of(" \t\r\n") + 1);

    // Append the source location and function name.
    ::rocket::ascii_numput nump;
    nump.put_DU(line);
    sbuf += "\n[thrown from function `";
    sbuf += func;
    sbuf += "` at '";
    sbuf += file;
    sbuf += ":";
    sbuf.append(nump.data(), nump.size());
    sbuf += "']";

    ::unw_context_t unw_ctx;
    ::unw_cursor_t unw_top;
    if((::unw_getcontext(&unw_ctx) == 0) && (::unw_init_local(&unw_top, &unw_ctx) == 0)) {
      sbuf += "\n[stack backtrace:";

      // Calculate the number of caller frames.
      size_t nframes = 0;
      ::unw_cursor_t unw_cur = unw_top;
      while(::unw_step(&unw_cur) > 0)
        nframes ++;

      nump.put_DU(nframes);
      static_vector<char, 8> numfield(nump.size(), ' ');

      // Append frames to the exception message.
      nframes = 0;
      unw_cur = unw_top;
      while(::unw_step(&unw_cur) > 0) {
        // * frame index
        nump.put_DU(++ nframes);
        ::std::reverse_copy(nump.begin(), nump.end(), numfield.mut_rbegin());
        sbuf += "\n  ";
        sbuf.append(numfield.data(), numfield.size());
        sbuf += ") ";

        // * instruction pointer
        ::unw_word_t unw_offset;
        ::unw_get_reg(&unw_cur, UNW_REG_IP, &unw_offset);
        nump.put_XU(unw_offset);
        sbuf.append(nump.data(), nump.size());

        char unw_name[1024];
        if(::unw_get_proc_name(&unw_cur, unw_name, sizeof(unw_name), &unw_offset) != 0)
          sbuf += " (unknown)";
        else {
          // * function signature and offset
          sbuf += " `";
          sbuf += unw_name;
          if(unw_offset > 0) {
            sbuf += "`+";
            nump.put_XU(unw_offset);
            sbuf.append(nump.data(), nump.size());
          }
        }
      }

      sbuf += "\n  -- end of stack backtrace]";
    }

    return ::std::runtime_error(sbuf);
  }

size_t
parse_network_reference(Network_Reference& caddr, chars_view str)
  noexcept
  {
    if(str.n == 0)
      return 0;

    // Users shall have removed leading and trailing whitespace before calling
    // this function.
    const char* bptr;
    const char* mptr = str.p;
    const char* eptr = str.p + str.n;
    int port_num = 0;

    if(*mptr == '[') {
      // Get an IPv6 address in brackets. An IPv4-mapped address may contain both
      // colons and dots. The address is not otherwise verified.
      bptr = mptr + 1;
      mptr = ::std::find_if_not(bptr, eptr,
        [](char c) {
          return ((c >= '0') && (c <= '9'))
                 || ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
                 || (c == ':') || (c == '.');
        });

      if((bptr == mptr) || (mptr == eptr) || (*mptr != ']'))
        return 0;

      caddr.host.p = bptr;
      caddr.host.n = (size_t) (mptr - bptr);
      caddr.is_ipv6 = true;

      // Skip it.
      ROCKET_ASSERT(*mptr == ']');
      mptr ++;
    }
    else {
      // Get a host name or an IPv4 address.
      bptr = mptr;
      mptr = ::std::find_if_not(bptr, eptr,
        [](char c) {
          return ((c >= '0') && (c <= '9'))
                 || ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
                 || (c == '-') || (c == '.') || (c == '_');
        });

      if(bptr == mptr)
        return 0;

      caddr.host.p = bptr;
      caddr.host.n = (size_t) (mptr - bptr);
    }

    if((mptr != eptr) && (*mptr == ':')) {
      // Get a port number.
      bptr = mptr + 1;
      mptr = ::std::find_if_not(bptr, eptr,
        [](char c) {
          return ((c >= '0') && (c <= '9'));
        });

      if(bptr == mptr)
        return 0;

      if(!::std::all_of(bptr, mptr,
           [&](char c) {
             port_num = port_num * 10 + (uint8_t) c - '0';
             return port_num <= UINT16_MAX;
           }))
        return 0;

      caddr.port.p = bptr;
      caddr.port.n = (size_t) (mptr - bptr);
      caddr.port_num = (uint16_t) port_num;
    }

    if((mptr != eptr) && (*mptr == '/')) {
      // Get a path. The leading slash is part of the path.
      bptr = mptr;
      mptr = ::std::find_if(bptr, eptr, [](char c) { return (c == '?') || (c == '#');  });
      caddr.path.p = bptr;
      caddr.path.n = (size_t) (mptr - bptr);
    }

    if((mptr != eptr) && (*mptr == '?')) {
      // Get a query string.
      bptr = mptr + 1;
      mptr = ::std::find(bptr, eptr, '#');
      caddr.query.p = bptr;
      caddr.query.n = (size_t) (mptr - bptr);
    }

    if((mptr != eptr) && (*mptr == '#')) {
      // Get a fragment string, which extends to the end.
      bptr = mptr + 1;
      mptr = eptr;
      caddr.fragment.p = bptr;
      caddr.fragment.n = (size_t) (mptr - bptr);
    }

    // Return the number of characters that have been consumed.
    return (size_t) (mptr - str.p);
  }

}  // namespace hermes
