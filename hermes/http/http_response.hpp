// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_HTTP_HTTP_RESPONSE_
#define HERMES_HTTP_HTTP_RESPONSE_

#include "../fwd.hpp"
#include "rfc822_headers.hpp"
namespace hermes {

// This is the status line and headers of a response. The body is not part
// of it.
struct HTTP_Response
  {
    cow_string version;  // e.g. `HTTP/1.0`
    uint32_t status = 0;
    cow_string reason;
    RFC822_Headers headers;
  };

}  // namespace hermes
#endif
