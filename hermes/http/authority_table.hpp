// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_AUTHORITY_TABLE_
#define HERMES_HTTP_AUTHORITY_TABLE_

#include "../fwd.hpp"
namespace hermes {

// This denotes a protection space on a server. All paths that start with
// `path_prefix` on `host:port` share the same credentials.
struct Authority_Entry
  {
    cow_string host;
    uint16_t port = 0;
    cow_string path_prefix;
    bool has_credentials = false;
    cow_string user;
    cow_string password;
  };

class Authority_Table
  {
  private:
    cow_vector<Authority_Entry> m_entries;

  public:
    // Constructs an empty table.
    Authority_Table() noexcept;

  public:
    Authority_Table(const Authority_Table&) = default;
    Authority_Table(Authority_Table&&) = default;
    Authority_Table& operator=(const Authority_Table&) & = default;
    Authority_Table& operator=(Authority_Table&&) & = default;
    ~Authority_Table();

    const Authority_Entry*
    begin()
      const noexcept
      { return this->m_entries.data();  }

    const Authority_Entry*
    end()
      const noexcept
      { return this->m_entries.data() + this->m_entries.size();  }

    size_t
    size()
      const noexcept
      { return this->m_entries.size();  }

    void
    clear()
      noexcept
      { this->m_entries.clear();  }

    // Appends an entry. Neither deduplication nor validation is performed.
    const Authority_Entry&
    add(const cow_string& host, uint16_t port, const cow_string& path_prefix);

    const Authority_Entry&
    add(const cow_string& host, uint16_t port, const cow_string& path_prefix,
        const cow_string& user, const cow_string& password);

    // Finds the entry whose path prefix is the longest prefix of `path`, among
    // those with the same host and port. Hosts are compared case-sensitively.
    // If more than one entry have the same prefix length, the earliest one is
    // returned. If no entry matches, a null pointer is returned.
    const Authority_Entry*
    find(const cow_string& host, uint16_t port, const cow_string& path)
      const noexcept;
  };

// Composes the value of an `Authorization` header for basic authentication,
// like `Basic dXNlcjpwYXNzd29yZA==`.
cow_string
basic_authorization(const Authority_Entry& entry);

}  // namespace hermes
#endif
