// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_FWD_
#define HERMES_FWD_

#include "version.h"
#include <rocket/atomic.hpp>
#include <rocket/mutex.hpp>
#include <rocket/tinyfmt_str.hpp>
#include <rocket/unique_posix_fd.hpp>
#include <rocket/linear_buffer.hpp>
#include <rocket/optional.hpp>
#include <asteria/value.hpp>
#include <asteria/utils.hpp>
#include <array>
#include <string>
#include <vector>

#define HERMES_HIDDEN_X_STRUCT(C, S)  \
  struct __attribute__((__visibility__("hidden"))) C::X_##S  \
    : S { using S::S, S::operator=;  }  // no semicolon

#define HERMES_USING  \
  template<typename... Ts> using

#define HERMES_SYSCALL_LOOP(...)  \
    __extension__  \
      ({  \
        auto wdLAlUiJ = (__VA_ARGS__);  \
        while(ROCKET_UNEXPECT(wdLAlUiJ < 0) && (errno == EINTR))  \
          wdLAlUiJ = (__VA_ARGS__);  \
        wdLAlUiJ;  \
      })

namespace hermes {
namespace noadl = hermes;
namespace fwd {

// Aliases
using ::std::initializer_list;
using ::std::nullptr_t;
using ::std::uint8_t;
using ::std::uint16_t;
using ::std::int32_t;
using ::std::uint32_t;
using ::std::int64_t;
using ::std::uint64_t;
using ::std::ptrdiff_t;
using ::std::size_t;
using ::std::exception;
using ::std::pair;

using ::rocket::atomic_relaxed;
using plain_mutex = ::rocket::mutex;
using ::rocket::cow_vector;
using ::rocket::static_vector;
using ::rocket::cow_string;
using ::rocket::phcow_string;
using ::rocket::linear_buffer;
using ::rocket::tinyfmt;
using ::rocket::tinyfmt_str;
using ::rocket::unique_posix_fd;

HERMES_USING cow_bivector = cow_vector<pair<Ts...>>;
HERMES_USING opt = ::rocket::optional<Ts...>;
HERMES_USING uniptr = ::std::unique_ptr<Ts...>;

using ::rocket::begin;
using ::rocket::end;
using ::rocket::swap;
using ::rocket::move;
using ::rocket::forward;
using ::rocket::size;
using ::rocket::make_unique_handle;
using ::rocket::min;
using ::rocket::max;
using ::rocket::clamp_cast;
using ::rocket::is_any_of;
using ::rocket::is_none_of;
using ::rocket::nullopt;

using ::asteria::format;
using ::asteria::sformat;

template<typename xValue, typename... xArgs>
ROCKET_ALWAYS_INLINE
uniptr<xValue>
new_uni(xArgs&&... args)
  {
    return ::std::make_unique<xValue>(forward<xArgs>(args)...);
  }

template<typename xValue>
ROCKET_ALWAYS_INLINE
uniptr<typename ::std::decay<xValue>::type>
new_uni(xValue&& value)
  {
    return ::std::make_unique<typename ::std::decay<xValue>::type>(forward<xValue>(value));
  }

struct chars_view
  {
    const char* p;
    size_t n;

    constexpr
    chars_view(nullptr_t = nullptr) noexcept
      : p(nullptr), n(0U)  { }

    constexpr
    chars_view(const char* xp, size_t xn) noexcept
      : p(xp), n(xn)  { }

    constexpr
    chars_view(const char* xs) noexcept
      : p(xs), n(xs ? ::rocket::xstrlen(xs) : 0U)  { }

    template<typename traitsT, typename allocT>
    constexpr
    chars_view(const ::std::basic_string<char, traitsT, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    constexpr
    chars_view(const ::rocket::shallow_string rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<size_t N>
    constexpr
    chars_view(const char (*ps)[N]) noexcept
      : p(*ps), n((ROCKET_ASSERT(*(*ps + N - 1) == '\0'), N - 1))  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_cow_string<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_tinyfmt_str<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_linear_buffer<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    // Returns the first character. Depending on the nature of the source string,
    // reading one character past the end might be allowed, so we don't check
    // whether `n` equals zero here.
    constexpr
    char
    operator*() const noexcept
      { return *(this->p);  }

    constexpr
    char
    operator[](size_t index) const noexcept
      { return ROCKET_ASSERT(index <= this->n), *(this->p + index);  }

    // Moves the view to the right.
    constexpr
    chars_view
    operator>>(size_t dist) const noexcept
      { return chars_view(this->p + dist, this->n - dist);  }

    constexpr
    chars_view&
    operator>>=(size_t dist) & noexcept
      { return *this = *this >> dist;  }

    // Makes a copy.
    explicit operator cow_string() const
      { return cow_string(this->p, this->n);  }
  };

inline
tinyfmt&
operator<<(tinyfmt& fmt, chars_view data)
  { return fmt.putn(data.p, data.n);  }

constexpr
bool
operator==(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n == rhs.n) && (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) == 0);  }

constexpr
bool
operator!=(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n != rhs.n) || (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) != 0);  }

}  // namespace fwd
using namespace fwd;

// Base types
class Config_File;
class Inflator;
class Abstract_Source;
class Array_Source;

// Socket types
class Abstract_Stream;
class TCP_Stream;

// HTTP types
enum HTTP_Status : uint16_t;
class HTTP_Field_Name;
class RFC822_Headers;
class HTTP_Target;
struct HTTP_Response;
struct URL;
struct Authority_Entry;
class Authority_Table;
class HTTP_Connection;

// Singletons
extern const cow_string empty_cow_string;
extern class Main_Config& main_config;
extern class Logger& logger;

}  // namespace hermes
#endif
