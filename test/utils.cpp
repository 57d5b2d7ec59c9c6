// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../hermes/utils.hpp"
using namespace ::hermes;

int
main()
  {
    try {
      HERMES_THROW((
          "test $1 $2 $$/end"),
          "exception:", 42);
    }
    catch(exception& e) {
      HERMES_TEST_CHECK(::std::strstr(e.what(),
          "test exception: 42 $/end") != nullptr);
    }

    HERMES_CHECK(1 + 1);
    HERMES_CHECK(true);
    HERMES_TEST_CHECK_CATCH(HERMES_CHECK(0+0));

    try {
      HERMES_CHECK(0+0);
    }
    catch(exception& e) {
      HERMES_TEST_CHECK(::std::strstr(e.what(),
          "HERMES_CHECK: 0+0") != nullptr);
    }

    // Logging is disabled without configuration, and must not throw.
    HERMES_LOG_ERROR(("unused $1"), 42);

    cow_string str = &"Hello, World!";
    HERMES_TEST_CHECK(ascii_uppercase(str) == "HELLO, WORLD!");
    HERMES_TEST_CHECK(ascii_lowercase(str) == "hello, world!");

    Network_Reference ref;
    HERMES_TEST_CHECK(parse_network_reference(ref, &"example.com") == 11);
    HERMES_TEST_CHECK(ref.host == "example.com");
    HERMES_TEST_CHECK(ref.port.p == nullptr);
    HERMES_TEST_CHECK(ref.port_num == 0);

    ref = Network_Reference();
    HERMES_TEST_CHECK(parse_network_reference(ref, &"proxy_1.lan:3128/a/b?x=1#top") == 28);
    HERMES_TEST_CHECK(ref.host == "proxy_1.lan");
    HERMES_TEST_CHECK(ref.port == "3128");
    HERMES_TEST_CHECK(ref.port_num == 3128);
    HERMES_TEST_CHECK(ref.path == "/a/b");
    HERMES_TEST_CHECK(ref.query == "x=1");
    HERMES_TEST_CHECK(ref.fragment == "top");

    ref = Network_Reference();
    HERMES_TEST_CHECK(parse_network_reference(ref, &"[::1]:80") == 8);
    HERMES_TEST_CHECK(ref.host == "::1");
    HERMES_TEST_CHECK(ref.is_ipv6);
    HERMES_TEST_CHECK(ref.port_num == 80);

    ref = Network_Reference();
    HERMES_TEST_CHECK(parse_network_reference(ref, &"example.com:65536") == 0);
    HERMES_TEST_CHECK(parse_network_reference(ref, &"example.com:") == 0);
    HERMES_TEST_CHECK(parse_network_reference(ref, &"[::1") == 0);
    HERMES_TEST_CHECK(parse_network_reference(ref, &"") == 0);

    ref = Network_Reference();
    HERMES_TEST_CHECK(parse_network_reference(ref, &"a.com x") == 5);

    // package information, as configured by the build system
    HERMES_TEST_CHECK(::strcmp(PACKAGE_STRING, "hermes " HERMES_ABI_VERSION_STRING) == 0);
    HERMES_TEST_CHECK(::strstr(PACKAGE_STRING, "http") == nullptr);
  }
