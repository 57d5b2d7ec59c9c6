// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_UTILS_
#define HERMES_UTILS_

#include "fwd.hpp"
#include "details/error_handling.hpp"
namespace hermes {

// Compose a log message and write it with the global logger. The `TEMPLATE`
// argument shall be a list of string literals in parentheses. Multiple strings
// are joined with line separators. `format()` is to be found via ADL.
#define HERMES_LOG_(LEVEL, TEMPLATE, ...)  \
  (::hermes::do_is_log_enabled(LEVEL)  \
   &&  \
   ([&](const char* func_ce7d) -> bool  \
      __attribute__((__nothrow__, __noinline__))  \
    {  \
      try {  \
        auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
          {  \
            using ::asteria::format;  \
            format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                    ##__VA_ARGS__);  \
          };  \
        \
        ::hermes::do_push_log_message(\
            LEVEL, func_ce7d, __FILE__, __LINE__,  \
            &c_Ru6q,  \
            [](::rocket::tinyfmt& fmt_Ko0i, void* p_5Gae)  \
              { (* static_cast<decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
      }  \
      catch(::std::exception& ex_Ue7w) {  \
        ::fprintf(stderr, "WARNING: Could not compose log message: %s\n",  \
                  ex_Ue7w.what());  \
      }  \
      return true;  \
    } (__func__)))

#define HERMES_LOG_FATAL(...)   HERMES_LOG_(0, __VA_ARGS__)
#define HERMES_LOG_ERROR(...)   HERMES_LOG_(1, __VA_ARGS__)
#define HERMES_LOG_WARN(...)    HERMES_LOG_(2, __VA_ARGS__)
#define HERMES_LOG_INFO(...)    HERMES_LOG_(3, __VA_ARGS__)
#define HERMES_LOG_DEBUG(...)   HERMES_LOG_(4, __VA_ARGS__)
#define HERMES_LOG_TRACE(...)   HERMES_LOG_(5, __VA_ARGS__)

// Throws an `std::runtime_error` object. The `TEMPLATE` argument shall be a
// list of string literals in parentheses. Multiple strings are joined with
// line separators. `format()` is to be found via ADL.
#define HERMES_THROW(TEMPLATE, ...)  \
  (throw \
   ([&](const char* func_ce7d) -> ::std::runtime_error  \
      __attribute__((__noinline__))  \
    {  \
      auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
        {  \
          using ::asteria::format;  \
          format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                  ##__VA_ARGS__);  \
        };  \
      \
      return ::hermes::do_create_runtime_error(\
          func_ce7d, __FILE__, __LINE__,  \
          &c_Ru6q,  \
          [](::rocket::tinyfmt& fmt_Ko0i, void* p_5Gae)  \
            { (* static_cast<decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
    } (__func__)))

#define HERMES_CHECK(...)  \
  (static_cast<bool>(__VA_ARGS__)  \
    ? void()  \
    : HERMES_THROW(("HERMES_CHECK: " #__VA_ARGS__)))

// Converts ASCII letters in place. Other bytes are left intact.
inline
cow_string&
ascii_uppercase(cow_string& str)
  {
    for(size_t k = 0;  k != str.size();  ++k)
      if((str[k] >= 'a') && (str[k] <= 'z'))
        str.mut(k) = (char) (str[k] & 0xDF);
    return str;
  }

inline
cow_string&
ascii_lowercase(cow_string& str)
  {
    for(size_t k = 0;  k != str.size();  ++k)
      if((str[k] >= 'A') && (str[k] <= 'Z'))
        str.mut(k) = (char) (str[k] | 0x20);
    return str;
  }

// This resembles a partial URI like `host[:port]/path?query#fragment`. The
// `scheme://` and `userinfo@` parts are handled by `URL`.
struct Network_Reference
  {
    chars_view host;
    chars_view port;
    chars_view path;
    chars_view query;
    chars_view fragment;
    uint16_t port_num = 0;
    bool is_ipv6 = false;
  };

// Parses a network reference. `str` shall start with a host name, followed by an
// optional port, an optional absolute path, an optional query string, and an
// optional fragment. If any optional part is absent, the corresponding field in
// `caddr` is left unmodified. They may be initialized with default values before
// calling this function. The path, query and fragment extend to the next
// delimiter and are not otherwise validated.
// Returns the number of character that have been parsed. Zero is returned if the
// address string is malformed.
size_t
parse_network_reference(Network_Reference& caddr, chars_view str)
  noexcept;

}  // namespace hermes
#endif
