// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "utils.hpp"
#include "../hermes/http/rfc822_headers.hpp"
using namespace ::hermes;

int
main()
  {
    RFC822_Headers hdrs;
    HERMES_TEST_CHECK(hdrs.empty());
    HERMES_TEST_CHECK(hdrs.find_opt(&"Host") == nullptr);

    hdrs.add(&"accept", &"*/*");
    hdrs.add(&"X-Test", &"1");
    hdrs.add(&"x-test", &"2");
    hdrs.add(&"Host", &"example.com");
    HERMES_TEST_CHECK(hdrs.size() == 4);
    HERMES_TEST_CHECK(hdrs.fields()[0].first.str() == "Accept");
    HERMES_TEST_CHECK(hdrs.fields()[2].first.str() == "X-Test");
    HERMES_TEST_CHECK(hdrs.count(&"X-TEST") == 2);
    HERMES_TEST_CHECK(*(hdrs.find_opt(&"x-test")) == "1");
    HERMES_TEST_CHECK_CATCH(hdrs.add(&"bad name", &"x"));
    HERMES_TEST_CHECK(hdrs.size() == 4);

    // Superseding keeps the position of the first field.
    hdrs.supersede(&"X-TEST", &"3");
    HERMES_TEST_CHECK(hdrs.size() == 3);
    HERMES_TEST_CHECK(hdrs.count(&"X-Test") == 1);
    HERMES_TEST_CHECK(hdrs.fields()[1].first.str() == "X-Test");
    HERMES_TEST_CHECK(hdrs.fields()[1].second == "3");
    HERMES_TEST_CHECK(hdrs.fields()[2].first.str() == "Host");

    hdrs.supersede(&"Referer", &"/");
    HERMES_TEST_CHECK(hdrs.size() == 4);
    HERMES_TEST_CHECK(hdrs.fields()[3].first.str() == "Referer");

    HERMES_TEST_CHECK(hdrs.erase(&"referer") == 1);
    HERMES_TEST_CHECK(hdrs.erase(&"referer") == 0);
    HERMES_TEST_CHECK(hdrs.size() == 3);

    // The first field from the other collection supersedes, and the others
    // are appended.
    RFC822_Headers extra;
    extra.add(&"Accept", &"text/html");
    extra.add(&"Accept", &"text/plain");
    extra.add(&"Cookie", &"a=1");
    hdrs.merge(extra);
    HERMES_TEST_CHECK(hdrs.size() == 5);
    HERMES_TEST_CHECK(hdrs.fields()[0].first.str() == "Accept");
    HERMES_TEST_CHECK(hdrs.fields()[0].second == "text/html");
    HERMES_TEST_CHECK(hdrs.fields()[3].first.str() == "Accept");
    HERMES_TEST_CHECK(hdrs.fields()[3].second == "text/plain");
    HERMES_TEST_CHECK(hdrs.fields()[4].first.str() == "Cookie");
    HERMES_TEST_CHECK(hdrs.count(&"Accept") == 2);

    // Parsing
    hdrs.clear();
    HERMES_TEST_CHECK(hdrs.parse(&"content-type:  text/html; charset=utf-8  \r\n"
                                  "X-Long: first\r\n"
                                  "  second \r\n"
                                  "\tthird\r\n"
                                  "no colon here\r\n"
                                  "Bad Name: x\n"
                                  "Empty:\n") == 2);
    HERMES_TEST_CHECK(hdrs.size() == 3);
    HERMES_TEST_CHECK(hdrs.fields()[0].first.str() == "Content-Type");
    HERMES_TEST_CHECK(hdrs.fields()[0].second == "text/html; charset=utf-8");
    HERMES_TEST_CHECK(*(hdrs.find_opt(&"X-LONG")) == "first  second\tthird");
    HERMES_TEST_CHECK(*(hdrs.find_opt(&"Empty")) == "");

    // A continuation line without a preceding field is rejected.
    RFC822_Headers orphan;
    HERMES_TEST_CHECK(!orphan.push_line(&" dangling"));
    HERMES_TEST_CHECK(orphan.empty());

    // Encoding
    hdrs.clear();
    hdrs.add(&"Host", &"example.com");
    hdrs.add(&"X-Multi", &"one\ntwo\n three\rfour");
    tinyfmt_str fmt;
    hdrs.encode(fmt);
    HERMES_TEST_CHECK(fmt.get_string() ==
                      "Host: example.com\r\n"
                      "X-Multi: one\r\n"
                      "\ttwo\r\n"
                      " three four\r\n");

    // Folded values are unfolded again.
    RFC822_Headers back;
    HERMES_TEST_CHECK(back.parse(fmt.get_string()) == 0);
    HERMES_TEST_CHECK(*(back.find_opt(&"x-multi")) == "one\ttwo three four");
  }
