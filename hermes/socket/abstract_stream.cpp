// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_stream.hpp"
#include "../utils.hpp"
namespace hermes {

Abstract_Stream::
~Abstract_Stream()
  {
  }

void
Abstract_Stream::
do_reset_buffers()
  noexcept
  {
    this->m_rqueue.clear();
    this->m_wqueue.clear();
    this->m_eof = false;
  }

bool
Abstract_Stream::
read_line(cow_string& line, size_t max_length)
  {
    line.clear();
    size_t searched = 0;

    for(;;) {
      auto lf = static_cast<const char*>(::memchr(this->m_rqueue.data() + searched, '\n',
                                                  this->m_rqueue.size() - searched));
      if(lf) {
        size_t len = (size_t) (lf - this->m_rqueue.data());
        if(len > max_length)
          HERMES_THROW(("Line length exceeds limit (`$1` > `$2`)"), len, max_length);

        line.assign(this->m_rqueue.data(), len);
        this->m_rqueue.discard(len + 1);

        if(!line.empty() && (line.back() == '\r'))
          line.pop_back();
        return true;
      }

      searched = this->m_rqueue.size();
      if(searched > max_length)
        HERMES_THROW(("Line length exceeds limit (`$1` > `$2`)"), searched, max_length);

      if(this->m_eof) {
        if(this->m_rqueue.empty())
          return false;

        // Return the incomplete line.
        line.assign(this->m_rqueue.data(), this->m_rqueue.size());
        this->m_rqueue.clear();
        return true;
      }

      // Read more data.
      this->m_rqueue.reserve_after_end(4096);
      size_t n = this->do_read_some(this->m_rqueue.mut_end(), this->m_rqueue.capacity_after_end());
      if(n == 0)
        this->m_eof = true;
      else
        this->m_rqueue.accept(n);
    }
  }

size_t
Abstract_Stream::
read_some(char* data, size_t size)
  {
    if(size == 0)
      return 0;

    if(!this->m_rqueue.empty())
      return this->m_rqueue.getn(data, size);

    if(this->m_eof)
      return 0;

    size_t n = this->do_read_some(data, size);
    if(n == 0)
      this->m_eof = true;
    return n;
  }

void
Abstract_Stream::
write(chars_view data)
  {
    this->m_wqueue.putn(data.p, data.n);
  }

void
Abstract_Stream::
flush()
  {
    if(this->m_wqueue.empty())
      return;

    this->do_write_all(this->m_wqueue.data(), this->m_wqueue.size());
    this->m_wqueue.clear();
  }

}  // namespace hermes
