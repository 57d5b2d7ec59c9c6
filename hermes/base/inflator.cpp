// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "inflator.hpp"
#include "../utils.hpp"
namespace hermes {

Inflator::
Inflator(zlib_Format format)
  :
    m_strm(format)
  {
  }

Inflator::
~Inflator()
  {
  }

size_t
Inflator::
inflate(chars_view data)
  {
    const char* in_ptr = data.p;
    const char* in_end = in_ptr + data.n;
    int err;
    bool out_full;

    do {
      constexpr size_t out_request = 1024;
      size_t out_size = out_request;
      char* out_ptr = this->do_on_inflate_get_output_buffer(out_size);
      if(out_size < out_request)
        HERMES_THROW((
            "`do_on_inflate_get_output_buffer()` shall not return smaller buffers (`$1` < `$2`)"),
            out_size, out_request);

      char* out_end = out_ptr + out_size;
      this->m_strm.set_buffers(out_ptr, out_end, in_ptr, in_end);
      err = ::inflate(this->m_strm, Z_SYNC_FLUSH);

      this->m_strm.get_buffers(out_ptr, in_ptr);
      this->do_on_inflate_truncate_output_buffer(static_cast<size_t>(out_end - out_ptr));

      if(is_none_of(err, { Z_OK, Z_BUF_ERROR, Z_STREAM_END }))
        HERMES_THROW(("zlib error: $1 (error `$2`)"), this->m_strm.msg(), err);

      // If the output buffer has been filled, there may be more output.
      out_full = out_ptr == out_end;
    }
    while((err == Z_OK) && ((in_ptr != in_end) || out_full));

    // Return the number of characters that have been consumed.
    return (size_t) (in_ptr - data.p);
  }

bool
Inflator::
finish()
  {
    const char* in_ptr = "";
    const char* in_end = in_ptr;
    int err;

    do {
      constexpr size_t out_request = 1024;
      size_t out_size = out_request;
      char* out_ptr = this->do_on_inflate_get_output_buffer(out_size);
      if(out_size < out_request)
        HERMES_THROW((
            "`do_on_inflate_get_output_buffer()` shall not return smaller buffers (`$1` < `$2`)"),
            out_size, out_request);

      char* out_end = out_ptr + out_size;
      this->m_strm.set_buffers(out_ptr, out_end, in_ptr, in_end);
      err = ::inflate(this->m_strm, Z_FINISH);

      this->m_strm.get_buffers(out_ptr, in_ptr);
      this->do_on_inflate_truncate_output_buffer(static_cast<size_t>(out_end - out_ptr));

      // `Z_BUF_ERROR` means no more output can be produced from an
      // incomplete stream.
      if(is_none_of(err, { Z_OK, Z_BUF_ERROR, Z_STREAM_END }))
        HERMES_THROW(("zlib error: $1 (error `$2`)"), this->m_strm.msg(), err);
    }
    while(err == Z_OK);

    // Return whether the stream has been terminated properly.
    return err == Z_STREAM_END;
  }

}  // namespace hermes
