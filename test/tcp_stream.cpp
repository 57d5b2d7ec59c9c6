// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../hermes/socket/tcp_stream.hpp"
#include "../hermes/http/http_connection.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <signal.h>
using namespace ::hermes;

namespace {

int s_alarm_listener = -1;
int s_alarm_accepted = -1;

void
do_accept_on_alarm(int)
  {
    int saved_errno = errno;
    s_alarm_accepted = ::accept(s_alarm_listener, nullptr, nullptr);
    errno = saved_errno;
  }

uint16_t
do_listen(unique_posix_fd& listener, int backlog)
  {
    listener.reset(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    HERMES_TEST_CHECK(listener);

    ::sockaddr_in addr = { };
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    HERMES_TEST_CHECK(::bind(listener, (::sockaddr*) &addr, sizeof(addr)) == 0);
    HERMES_TEST_CHECK(::listen(listener, backlog) == 0);

    ::socklen_t addrlen = sizeof(addr);
    HERMES_TEST_CHECK(::getsockname(listener, (::sockaddr*) &addr, &addrlen) == 0);
    return ntohs(addr.sin_port);
  }

void
do_send_reply(int peer, const char* reply)
  {
    ::ssize_t len = (::ssize_t) ::strlen(reply);
    HERMES_TEST_CHECK(::send(peer, reply, (size_t) len, 0) == len);
    ::shutdown(peer, SHUT_WR);
  }

}  // namespace

int
main()
  {
    // Create a listening socket on an ephemeral port.
    unique_posix_fd listener;
    uint16_t port = do_listen(listener, 1);

    TCP_Stream stream;
    HERMES_TEST_CHECK(!stream.is_open());
    HERMES_TEST_CHECK(stream.connect(&"127.0.0.1", port));
    HERMES_TEST_CHECK(stream.is_open());

    // The connection has been established by the kernel. The response is
    // queued before the request is sent.
    HTTP_Connection conn(stream);
    unique_posix_fd peer(::accept4(listener, nullptr, nullptr, SOCK_CLOEXEC));
    HERMES_TEST_CHECK(peer);
    do_send_reply(peer, "HTTP/1.0 200 OK\r\nContent-Length: 5\r\n\r\nhello");

    auto body = conn.request_data(&"GET", "http://127.0.0.1/");
    HERMES_TEST_CHECK(body);
    HERMES_TEST_CHECK(body->read_all() == "hello");

    char req[256];
    ::ssize_t n = ::recv(peer, req, sizeof(req) - 1, 0);
    HERMES_TEST_CHECK(n > 0);
    req[n] = 0;
    HERMES_TEST_CHECK(::strncmp(req, "GET / HTTP/1.0\r\n", 16) == 0);

    stream.close();
    HERMES_TEST_CHECK(!stream.is_open());
    peer.reset();

    // Read a body without a length, which ends at the end of the stream.
    HERMES_TEST_CHECK(stream.connect(&"127.0.0.1", port));
    peer.reset(::accept4(listener, nullptr, nullptr, SOCK_CLOEXEC));
    HERMES_TEST_CHECK(peer);
    do_send_reply(peer, "HTTP/1.0 200 OK\r\n\r\nfirst");

    body = conn.request_data(&"GET", "http://127.0.0.1/one");
    HERMES_TEST_CHECK(body);
    HERMES_TEST_CHECK(body->read_all() == "first");

    // Output that has not been flushed is discarded by `close()`.
    stream.write(&"stale");
    stream.close();
    peer.reset();

    // A new connection starts with empty buffers and no end of stream.
    unique_posix_fd listener2;
    uint16_t port2 = do_listen(listener2, 1);
    HERMES_TEST_CHECK(stream.connect(&"127.0.0.1", port2));
    unique_posix_fd peer2(::accept4(listener2, nullptr, nullptr, SOCK_CLOEXEC));
    HERMES_TEST_CHECK(peer2);
    do_send_reply(peer2, "HTTP/1.0 404 Not Found\r\nContent-Length: 0\r\n\r\n");

    auto resp = conn.get("http://127.0.0.1/two");
    HERMES_TEST_CHECK(resp);
    HERMES_TEST_CHECK(resp->status == 404);
    HERMES_TEST_CHECK(resp->reason == "Not Found");

    n = ::recv(peer2, req, sizeof(req) - 1, 0);
    HERMES_TEST_CHECK(n > 0);
    req[n] = 0;
    HERMES_TEST_CHECK(::strncmp(req, "GET /two HTTP/1.0\r\n", 19) == 0);

    stream.close();
    peer2.reset();
    listener2.reset();

    // Nothing listens on the port after it is closed.
    listener.reset();
    HERMES_TEST_CHECK(!stream.connect(&"127.0.0.1", port));
    HERMES_TEST_CHECK(!stream.is_open());

    HERMES_TEST_CHECK_CATCH(stream.connect(&"no-such-host.invalid", 80));

    // Fill the accept queue, so the next handshake stalls until a slot is
    // released. A signal interrupts `connect()` in the meantime, and its
    // handler releases the slot. The handshake then completes when the SYN
    // is retransmitted.
    unique_posix_fd listener3;
    uint16_t port3 = do_listen(listener3, 0);
    unique_posix_fd filler(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    HERMES_TEST_CHECK(filler);
    ::sockaddr_in addr3 = { };
    addr3.sin_family = AF_INET;
    addr3.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr3.sin_port = htons(port3);
    HERMES_TEST_CHECK(::connect(filler, (::sockaddr*) &addr3, sizeof(addr3)) == 0);

    struct sigaction sigact = { };
    sigact.sa_handler = do_accept_on_alarm;
    sigact.sa_flags = 0;  // no SA_RESTART
    HERMES_TEST_CHECK(::sigaction(SIGALRM, &sigact, nullptr) == 0);

    s_alarm_listener = listener3;
    ::itimerval itv = { };
    itv.it_value.tv_usec = 100000;
    HERMES_TEST_CHECK(::setitimer(ITIMER_REAL, &itv, nullptr) == 0);

    HERMES_TEST_CHECK(stream.connect(&"127.0.0.1", port3));
    HERMES_TEST_CHECK(stream.is_open());
    HERMES_TEST_CHECK(s_alarm_accepted >= 0);
    ::close(s_alarm_accepted);

    unique_posix_fd peer3(::accept4(listener3, nullptr, nullptr, SOCK_CLOEXEC));
    HERMES_TEST_CHECK(peer3);

    sigact.sa_handler = SIG_DFL;
    ::sigaction(SIGALRM, &sigact, nullptr);
    stream.close();
  }
