// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_BASE_MIME_DECODER_
#define HERMES_BASE_MIME_DECODER_

#include "../fwd.hpp"
#include "abstract_source.hpp"
namespace hermes {

// Wraps `source` into a new source which decodes data according to a
// `Content-Transfer-Encoding`. `base64` and `quoted-printable` are decoded.
// `7bit`, `8bit` and `binary` denote identity. Names are case-insensitive.
// For any other encoding, a warning is logged and `source` is returned as is.
// Corrupted data cause exceptions when read.
uniptr<Abstract_Source>
decode_mime_source(uniptr<Abstract_Source>&& source, const cow_string& encoding);

// Wraps `source` into a new source which decodes data according to a
// `Content-Encoding`. `gzip`, `x-gzip` and `deflate` are decompressed with
// zlib. `identity` denotes identity. For any other encoding, a warning is
// logged and `source` is returned as is.
uniptr<Abstract_Source>
decode_content_source(uniptr<Abstract_Source>&& source, const cow_string& encoding);

}  // namespace hermes
#endif
