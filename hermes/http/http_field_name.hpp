// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_HTTP_FIELD_NAME_
#define HERMES_HTTP_HTTP_FIELD_NAME_

#include "../fwd.hpp"
namespace hermes {

// This is the name of a header field. Names are compared and hashed in a
// case-insensitive way, but the original spelling is kept.
class HTTP_Field_Name
  {
  private:
    cow_string m_str;

  public:
    HTTP_Field_Name()
      noexcept = default;

    template<typename xstringT,
    ROCKET_ENABLE_IF(::std::is_constructible<cow_string, xstringT&&>::value)>
    explicit
    HTTP_Field_Name(xstringT&& xstr)
      noexcept(::std::is_nothrow_constructible<cow_string, xstringT&&>::value)
      :
        m_str(forward<xstringT>(xstr))
      { }

    HTTP_Field_Name&
    swap(HTTP_Field_Name& other)
      noexcept
      {
        this->m_str.swap(other.m_str);
        return *this;
      }

  public:
    HTTP_Field_Name(const HTTP_Field_Name&) = default;
    HTTP_Field_Name(HTTP_Field_Name&&) = default;
    HTTP_Field_Name& operator=(const HTTP_Field_Name&) & = default;
    HTTP_Field_Name& operator=(HTTP_Field_Name&&) & = default;
    ~HTTP_Field_Name();

    const cow_string&
    str()
      const noexcept
      { return this->m_str;  }

    bool
    empty()
      const noexcept
      { return this->m_str.empty();  }

    size_t
    size()
      const noexcept
      { return this->m_str.size();  }

    const char*
    c_str()
      const noexcept
      { return this->m_str.c_str();  }

    // Compares names in a case-insensitive way.
    ROCKET_PURE
    bool
    equals(chars_view other)
      const noexcept;

    // Gets the case-insensitive hash value of this name.
    ROCKET_PURE
    size_t
    rdhash()
      const noexcept;

    // Validates this name and converts it to the conventional spelling, where
    // the first letter of each dash-separated word is in uppercase and all
    // other letters are in lowercase, such as `Content-Transfer-Encoding`. If
    // this string is not a valid HTTP token, an exception is thrown, and the
    // string may have been partially modified.
    void
    canonicalize();
  };

inline
void
swap(HTTP_Field_Name& lhs, HTTP_Field_Name& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return lhs.equals(rhs.str());  }

inline
bool
operator==(const HTTP_Field_Name& lhs, chars_view rhs)
  noexcept
  { return lhs.equals(rhs);  }

inline
bool
operator==(chars_view lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return rhs.equals(lhs);  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return !lhs.equals(rhs.str());  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, chars_view rhs)
  noexcept
  { return !lhs.equals(rhs);  }

inline
bool
operator!=(chars_view lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return !rhs.equals(lhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_Field_Name& name)
  {
    return fmt << name.str();
  }

}  // namespace hermes
#endif
