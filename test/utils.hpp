// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_TEST_UTILS_
#define HERMES_TEST_UTILS_

#include "../hermes/xprecompiled.hpp"
#include "../hermes/fwd.hpp"
#include <stdio.h>
#include <stdlib.h>

#define HERMES_TEST_CHECK(expr)  \
  ((expr)  \
    ? (void) ::fprintf(stderr, "PASS: %s\n", #expr)  \
    : (::fprintf(stderr, "FAIL: %s\n  at %s:%d\n", #expr, __FILE__, __LINE__),  \
       ::abort()))

#define HERMES_TEST_CHECK_CATCH(expr)  \
  do  \
    try {  \
      static_cast<void>(expr);  \
      ::fprintf(stderr, "FAIL (no exception): %s\n  at %s:%d\n",  \
                #expr, __FILE__, __LINE__);  \
      ::abort();  \
    }  \
    catch(::std::exception& ex_ki2b) {  \
      ::fprintf(stderr, "PASS (caught `%s`): %s\n",  \
                ex_ki2b.what(), #expr);  \
    }  \
  while(false)  // no semicolon

#endif
