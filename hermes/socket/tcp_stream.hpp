// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_SOCKET_TCP_STREAM_
#define HERMES_SOCKET_TCP_STREAM_

#include "../fwd.hpp"
#include "abstract_stream.hpp"
namespace hermes {

class TCP_Stream
  : public Abstract_Stream
  {
  private:
    unique_posix_fd m_fd;
    cow_string m_host;
    uint16_t m_port = 0;

  protected:
    size_t
    do_read_some(char* data, size_t size) override;

    void
    do_write_all(const char* data, size_t size) override;

  public:
    // Creates a stream that is not connected.
    TCP_Stream() noexcept;

  public:
    TCP_Stream(const TCP_Stream&) = delete;
    TCP_Stream& operator=(const TCP_Stream&) & = delete;
    virtual ~TCP_Stream();

    bool
    is_open()
      const noexcept
      { return this->m_fd.get() >= 0;  }

    // Resolves `host` and connects to the first address that accepts the
    // connection. Timeouts are taken from `network.tcp.connect_timeout` and
    // `network.tcp.io_timeout` in 'main.conf'. If no connection can be
    // established, a warning is logged and `false` is returned. If the host
    // name cannot be resolved, an exception is thrown.
    bool
    connect(const cow_string& host, uint16_t port);

    // Closes the connection. Buffered output that has not been flushed is
    // discarded.
    void
    close()
      noexcept;
  };

}  // namespace hermes
#endif
