// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_SOCKET_ABSTRACT_STREAM_
#define HERMES_SOCKET_ABSTRACT_STREAM_

#include "../fwd.hpp"
namespace hermes {

// This is a bidirectional byte stream to a single peer, with buffering in
// both directions. I/O operations block.
class Abstract_Stream
  {
  private:
    linear_buffer m_rqueue;
    linear_buffer m_wqueue;
    bool m_eof = false;

  public:
    Abstract_Stream() noexcept = default;

  protected:
    // Reads at most `size` bytes into `data`. At the end of the stream, zero
    // shall be returned. Errors shall be reported as exceptions.
    virtual
    size_t
    do_read_some(char* data, size_t size) = 0;

    // Writes all bytes from `data`. Errors shall be reported as exceptions.
    virtual
    void
    do_write_all(const char* data, size_t size) = 0;

    // Discards all buffered data in both directions and clears the end-of-
    // stream flag. This shall be called when the underlying connection is
    // replaced.
    void
    do_reset_buffers()
      noexcept;

  public:
    Abstract_Stream(const Abstract_Stream&) = delete;
    Abstract_Stream& operator=(const Abstract_Stream&) & = delete;
    virtual ~Abstract_Stream();

    // Reads a line, which is terminated by LF. The terminator and a CR before
    // it are removed. If the stream ends before a terminator, the partial line
    // is returned. If the stream has ended and no data remain, `false` is
    // returned. If the line is longer than `max_length`, an exception is
    // thrown.
    bool
    read_line(cow_string& line, size_t max_length);

    // Reads at most `size` bytes, and returns the number of bytes that have
    // been read. Zero is returned at the end of the stream.
    size_t
    read_some(char* data, size_t size);

    // Appends data to the output buffer.
    void
    write(chars_view data);

    // Sends all data in the output buffer.
    void
    flush();
  };

}  // namespace hermes
#endif
