// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "tcp_stream.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <sys/time.h>
#include <poll.h>
namespace hermes {
namespace {

void
do_set_timeout(int fd, int opt, int64_t secs)
  {
    ::timeval tv;
    tv.tv_sec = (::time_t) secs;
    tv.tv_usec = 0;
    if(::setsockopt(fd, SOL_SOCKET, opt, &tv, sizeof(tv)) != 0)
      HERMES_THROW((
          "Could not set socket timeout",
          "[`setsockopt()` failed: ${errno:full}]"));
  }

int
do_connect_nointr(int fd, const ::sockaddr* addr, ::socklen_t addrlen, int64_t timeout)
  {
    if(::connect(fd, addr, addrlen) == 0)
      return 0;

    if(errno != EINTR)
      return -1;

    // An interrupted connection attempt continues in the background, and must
    // not be restarted.
    ::pollfd pfd = { fd, POLLOUT, 0 };
    int r = HERMES_SYSCALL_LOOP(::poll(&pfd, 1, (int) (timeout * 1000)));
    if(r < 0)
      return -1;

    if(r == 0) {
      errno = ETIMEDOUT;
      return -1;
    }

    int err = 0;
    ::socklen_t optlen = sizeof(err);
    if(::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &optlen) != 0)
      return -1;

    if(err != 0) {
      errno = err;
      return -1;
    }
    return 0;
  }

}  // namespace

TCP_Stream::
TCP_Stream() noexcept
  {
  }

TCP_Stream::
~TCP_Stream()
  {
  }

size_t
TCP_Stream::
do_read_some(char* data, size_t size)
  {
    if(!this->m_fd)
      HERMES_THROW(("Stream not connected"));

    ::ssize_t r = HERMES_SYSCALL_LOOP(::recv(this->m_fd, data, size, 0));
    if(r < 0)
      HERMES_THROW((
          "Could not read from `$1:$2`",
          "[`recv()` failed: ${errno:full}]"),
          this->m_host, this->m_port);

    return (size_t) r;
  }

void
TCP_Stream::
do_write_all(const char* data, size_t size)
  {
    if(!this->m_fd)
      HERMES_THROW(("Stream not connected"));

    const char* bptr = data;
    const char* eptr = data + size;
    while(bptr != eptr) {
      ::ssize_t r = HERMES_SYSCALL_LOOP(::send(this->m_fd, bptr, (size_t) (eptr - bptr), MSG_NOSIGNAL));
      if(r < 0)
        HERMES_THROW((
            "Could not write to `$1:$2`",
            "[`send()` failed: ${errno:full}]"),
            this->m_host, this->m_port);

      bptr += r;
    }
  }

bool
TCP_Stream::
connect(const cow_string& host, uint16_t port)
  {
    int64_t connect_timeout = main_config.copy_integer_opt(&"network.tcp.connect_timeout", 1, 3600).value_or(30);
    int64_t io_timeout = main_config.copy_integer_opt(&"network.tcp.io_timeout", 1, 3600).value_or(60);

    // Resolve the host name. Port numbers are always numeric.
    ::rocket::ascii_numput nump;
    nump.put_DU(port);

    ::addrinfo hints = { };
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_V4MAPPED | AI_NUMERICSERV;

    ::addrinfo* res;
    int err = ::getaddrinfo(host.safe_c_str(), nump.c_str(), &hints, &res);
    if(err != 0)
      HERMES_THROW((
          "Could not resolve host `$1`",
          "[`getaddrinfo()` failed: $2]"),
          host, ::gai_strerror(err));

    const auto guard = make_unique_handle(res, ::freeaddrinfo);

    // Try each address in order.
    unique_posix_fd fd;
    for(::addrinfo* ai = res;  ai;  ai = ai->ai_next) {
      fd.reset(::socket(ai->ai_family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP));
      if(!fd) {
        HERMES_LOG_WARN(("Could not create socket: ${errno:full}"));
        continue;
      }

      // On Linux, a send timeout applies to `connect()` as well.
      do_set_timeout(fd, SO_SNDTIMEO, connect_timeout);

      if(do_connect_nointr(fd, ai->ai_addr, ai->ai_addrlen, connect_timeout) == 0)
        break;

      HERMES_LOG_DEBUG(("Could not connect to `$1:$2`: ${errno:full}"), host, port);
      fd.reset();
    }

    if(!fd) {
      HERMES_LOG_WARN(("Could not connect to `$1:$2`: no address available"), host, port);
      return false;
    }

    do_set_timeout(fd, SO_SNDTIMEO, io_timeout);
    do_set_timeout(fd, SO_RCVTIMEO, io_timeout);

    int ival = 1;
    if(::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &ival, sizeof(ival)) != 0)
      HERMES_LOG_WARN(("Could not disable Nagle algorithm: ${errno:full}"));

    this->m_fd = move(fd);
    this->do_reset_buffers();
    this->m_host = host;
    this->m_port = port;
    HERMES_LOG_DEBUG(("Connected to `$1:$2`"), host, port);
    return true;
  }

void
TCP_Stream::
close()
  noexcept
  {
    this->m_fd.reset();
    this->do_reset_buffers();
  }

}  // namespace hermes
