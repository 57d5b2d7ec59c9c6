// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_THIRD_OPENSSL_FWD_
#define HERMES_THIRD_OPENSSL_FWD_

#include "../fwd.hpp"
#include <openssl/evp.h>
namespace hermes {

struct EVP_ENCODE_CTX_deleter
  {
    void
    operator()(::EVP_ENCODE_CTX* p) const noexcept
      { ::EVP_ENCODE_CTX_free(p);  }
  };

using uniptr_EVP_ENCODE_CTX = ::std::unique_ptr<::EVP_ENCODE_CTX, EVP_ENCODE_CTX_deleter>;

}  // namespace hermes
#endif
