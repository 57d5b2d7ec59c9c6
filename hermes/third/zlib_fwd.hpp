// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_THIRD_ZLIB_FWD_
#define HERMES_THIRD_ZLIB_FWD_

#include "../fwd.hpp"
#include "../utils.hpp"
#define ZLIB_CONST 1
#include <zlib.h>
namespace hermes {

enum zlib_Format : uint8_t
  {
    zlib_deflate  = 0,  // deflate data with zlib header
    zlib_raw      = 1,  // raw deflate data
    zlib_gzip     = 2,  // deflate data with gzip header
  };

class scoped_inflate_stream
  {
  private:
    mutable ::z_stream m_strm[1];

  public:
    // The window size is always 32KiB, which is the maximum value, and is
    // what HTTP servers use.
    explicit
    scoped_inflate_stream(zlib_Format fmt)
      {
        int wbits = 15;
        if(fmt == zlib_raw)
          wbits = -15;
        else if(fmt == zlib_gzip)
          wbits = 15 + 16;
        else if(fmt != zlib_deflate)
          HERMES_THROW(("Invalid zlib format `$1`"), (int) fmt);

        this->m_strm->zalloc = nullptr;
        this->m_strm->zfree = nullptr;
        this->m_strm->opaque = nullptr;
        this->m_strm->next_in = nullptr;
        this->m_strm->avail_in = 0;

        int err = ::inflateInit2(this->m_strm, wbits);
        if(err != Z_OK)
          HERMES_THROW(("Could not initialize inflate stream: error `$1`"), err);
      }

    ~scoped_inflate_stream()
      {
        ::inflateEnd(this->m_strm);
      }

    scoped_inflate_stream(const scoped_inflate_stream&) = delete;
    scoped_inflate_stream& operator=(const scoped_inflate_stream&) & = delete;

    operator ::z_stream*() const noexcept { return this->m_strm;  }

    const char*
    msg() const noexcept
      { return this->m_strm->msg ? this->m_strm->msg : "no error";  }

    void
    get_buffers(char*& ocur, const char*& icur) noexcept
      {
        ocur = reinterpret_cast<char*>(this->m_strm->next_out);
        icur = reinterpret_cast<const char*>(this->m_strm->next_in);
      }

    void
    set_buffers(char* ocur, char* oend, const char* icur, const char* iend) noexcept
      {
        this->m_strm->next_out = reinterpret_cast<::Bytef*>(ocur);
        this->m_strm->avail_out = ::rocket::clamp_cast<::uInt>(oend - ocur, 0, INT_MAX);
        this->m_strm->next_in = reinterpret_cast<const ::Bytef*>(icur);
        this->m_strm->avail_in = ::rocket::clamp_cast<::uInt>(iend - icur, 0, INT_MAX);
      }
  };

}  // namespace hermes
#endif
