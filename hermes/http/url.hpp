// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_URL_
#define HERMES_HTTP_URL_

#include "../fwd.hpp"
namespace hermes {

// This is a URL like `scheme://userinfo@host:port/path?query#fragment`, in
// which every part is optional. Parts are stored as they appear, without
// decoding.
struct URL
  {
    cow_string scheme;  // lowercase
    cow_string userinfo;
    cow_string host;
    uint16_t port = 0;  // zero if not specified
    cow_string path;
    cow_string query;
    cow_string fragment;
    bool has_host = false;
    bool has_query = false;
    bool has_fragment = false;

    // Parses a URL. Relative references such as `/index.html?a=1`, and
    // protocol-relative ones such as `//example.com/`, are accepted. If the
    // string is malformed, `false` is returned, and the contents of this
    // object are unspecified.
    bool
    parse(chars_view str);

    // Gets the port number to connect to. If no port has been specified, the
    // default one for the scheme is returned.
    uint16_t
    effective_port()
      const noexcept;

    // Returns the path followed by the query string, as in an HTTP request
    // line. An empty path is returned as `/`.
    cow_string
    local_part()
      const;

    // Returns the host and port as in an HTTP `Host` header. The port is
    // included only if it differs from the default one.
    cow_string
    host_header()
      const;
  };

}  // namespace hermes
#endif
