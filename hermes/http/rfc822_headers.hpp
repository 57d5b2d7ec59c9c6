// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_RFC822_HEADERS_
#define HERMES_HTTP_RFC822_HEADERS_

#include "../fwd.hpp"
#include "http_field_name.hpp"
namespace hermes {

// This is an ordered collection of header fields, as found in mail messages
// and HTTP requests and responses. A name may occur more than once.
class RFC822_Headers
  {
  private:
    cow_bivector<HTTP_Field_Name, cow_string> m_fields;

  public:
    // Constructs an empty collection.
    RFC822_Headers() noexcept;

    RFC822_Headers&
    swap(RFC822_Headers& other)
      noexcept
      {
        this->m_fields.swap(other.m_fields);
        return *this;
      }

  public:
    RFC822_Headers(const RFC822_Headers&) = default;
    RFC822_Headers(RFC822_Headers&&) = default;
    RFC822_Headers& operator=(const RFC822_Headers&) & = default;
    RFC822_Headers& operator=(RFC822_Headers&&) & = default;
    ~RFC822_Headers();

    // Gets all fields in order.
    const cow_bivector<HTTP_Field_Name, cow_string>&
    fields()
      const noexcept
      { return this->m_fields;  }

    bool
    empty()
      const noexcept
      { return this->m_fields.empty();  }

    size_t
    size()
      const noexcept
      { return this->m_fields.size();  }

    void
    clear()
      noexcept
      { this->m_fields.clear();  }

    // Appends a field. The name is converted to its canonical spelling. If
    // the name is not a valid token, an exception is thrown, and there is no
    // effect.
    void
    add(const cow_string& name, const cow_string& value);

    // Replaces all fields with the same name as `name` with a single field.
    // The new field takes the place of the first old one. If no such field
    // exists, it is appended.
    void
    supersede(const cow_string& name, const cow_string& value);

    // Removes all fields with the given name, and returns the number of fields
    // that have been removed.
    size_t
    erase(chars_view name);

    // Gets the value of the first field with the given name. If no such field
    // exists, a null pointer is returned.
    const cow_string*
    find_opt(chars_view name)
      const noexcept;

    // Gets the number of fields with the given name.
    size_t
    count(chars_view name)
      const noexcept;

    // Merges fields from `other`. For each name in `other`, its first field
    // supersedes fields in `*this`, and the others are appended.
    void
    merge(const RFC822_Headers& other);

    // Parses a header line, without its line terminator. If the line begins
    // with a space or tab, it continues the previous field. If the line is
    // malformed, `false` is returned, and there is no effect.
    bool
    push_line(const cow_string& line);

    // Parses a block of header lines. Lines may be terminated by either CR LF
    // or LF. Malformed lines are skipped, and their number is returned.
    size_t
    parse(chars_view text);

    // Writes all fields, each of which is terminated by CR LF. Line breaks in
    // values are written as continuation lines. No empty line is appended.
    void
    encode(tinyfmt& fmt)
      const;
  };

inline
void
swap(RFC822_Headers& lhs, RFC822_Headers& rhs)
  noexcept
  { lhs.swap(rhs);  }

}  // namespace hermes
#endif
