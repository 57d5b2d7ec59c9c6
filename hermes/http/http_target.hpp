// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_HTTP_TARGET_
#define HERMES_HTTP_HTTP_TARGET_

#include "../fwd.hpp"
namespace hermes {

// This is the target of a request. It is either a plain URI, or a URI with
// an explicit referer. For a plain URI, the referer is chosen by the
// connection.
class HTTP_Target
  {
  public:
    enum Kind : uint8_t
      {
        kind_plain         = 0,
        kind_with_referer  = 1,
      };

  private:
    Kind m_kind;
    cow_string m_uri;
    cow_string m_referer;

  public:
    HTTP_Target(const cow_string& uri)
      :
        m_kind(kind_plain), m_uri(uri)
      { }

    HTTP_Target(const char* uri)
      :
        m_kind(kind_plain), m_uri(uri)
      { }

    HTTP_Target(const cow_string& uri, const cow_string& referer)
      :
        m_kind(kind_with_referer), m_uri(uri), m_referer(referer)
      { }

  public:
    HTTP_Target(const HTTP_Target&) = default;
    HTTP_Target(HTTP_Target&&) = default;
    HTTP_Target& operator=(const HTTP_Target&) & = default;
    HTTP_Target& operator=(HTTP_Target&&) & = default;
    ~HTTP_Target() = default;

    Kind
    kind()
      const noexcept
      { return this->m_kind;  }

    const cow_string&
    uri()
      const noexcept
      { return this->m_uri;  }

    bool
    has_referer()
      const noexcept
      { return this->m_kind == kind_with_referer;  }

    // Gets the referer. If the target is plain, an empty string is returned.
    const cow_string&
    referer()
      const noexcept
      { return this->m_referer;  }
  };

}  // namespace hermes
#endif
