// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "authority_table.hpp"
#include "../utils.hpp"
#include <openssl/evp.h>
namespace hermes {

Authority_Table::
Authority_Table() noexcept
  {
  }

Authority_Table::
~Authority_Table()
  {
  }

const Authority_Entry&
Authority_Table::
add(const cow_string& host, uint16_t port, const cow_string& path_prefix)
  {
    auto& entry = this->m_entries.emplace_back();
    entry.host = host;
    entry.port = port;
    entry.path_prefix = path_prefix;
    return entry;
  }

const Authority_Entry&
Authority_Table::
add(const cow_string& host, uint16_t port, const cow_string& path_prefix,
    const cow_string& user, const cow_string& password)
  {
    auto& entry = this->m_entries.emplace_back();
    entry.host = host;
    entry.port = port;
    entry.path_prefix = path_prefix;
    entry.has_credentials = true;
    entry.user = user;
    entry.password = password;
    return entry;
  }

const Authority_Entry*
Authority_Table::
find(const cow_string& host, uint16_t port, const cow_string& path)
  const noexcept
  {
    const Authority_Entry* best = nullptr;
    for(const auto& entry : this->m_entries)
      if((entry.port == port) && (entry.host == host) && path.starts_with(entry.path_prefix)) {
        // Only a strictly longer prefix replaces the current one.
        if(!best || (entry.path_prefix.size() > best->path_prefix.size()))
          best = &entry;
      }
    return best;
  }

cow_string
basic_authorization(const Authority_Entry& entry)
  {
    cow_string plain = entry.user;
    plain.push_back(':');
    plain.append(entry.password);

    cow_string result = &"Basic ";
    size_t bpos = result.size();
    result.append((plain.size() + 2) / 3 * 4 + 1, '\0');

    int len = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.mut_data() + bpos),
                                reinterpret_cast<const unsigned char*>(plain.data()),
                                static_cast<int>(plain.size()));
    if(len < 0)
      HERMES_THROW(("Could not encode credentials"));

    result.erase(bpos + (uint32_t) len);
    return result;
  }

}  // namespace hermes
