// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_BASE_INFLATOR_
#define HERMES_BASE_INFLATOR_

#include "../fwd.hpp"
#include "../third/zlib_fwd.hpp"
namespace hermes {

class Inflator
  {
  private:
    scoped_inflate_stream m_strm;

  public:
    // Constructs a data decompressor.
    explicit
    Inflator(zlib_Format format);

  protected:
    // This callback is invoked to request an output buffer if none has been
    // requested, or when the previous output buffer is full. Derived classes
    // shall return a buffer of at least `size` bytes where decompressed data
    // will be written, or throw an exception if the request cannot be honored.
    // `size` may be updated to reflect the real size of the output buffer, but
    // its value shall not be decreased.
    virtual
    char*
    do_on_inflate_get_output_buffer(size_t& size) = 0;

    // This callback is invoked to inform derived classes that `backup` bytes
    // in the end of the previous buffer have not been written.
    virtual
    void
    do_on_inflate_truncate_output_buffer(size_t backup) = 0;

  public:
    Inflator(const Inflator&) = delete;
    Inflator& operator=(const Inflator&) & = delete;
    virtual ~Inflator();

    // Decompresses some data and returns the number of bytes that have been
    // consumed. This function may return a value that is less than `data.n`
    // if an end-of-stream marker has been encountered. If the data are
    // corrupted, an exception is thrown.
    size_t
    inflate(chars_view data);

    // Completes the current stream. If no end-of-stream marker has been found,
    // `false` is returned.
    bool
    finish();
  };

}  // namespace hermes
#endif
