// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_BASE_ABSTRACT_SOURCE_
#define HERMES_BASE_ABSTRACT_SOURCE_

#include "../fwd.hpp"
namespace hermes {

// This is a lazy sequence of byte chunks, such as a request body or a
// response body. Chunks are produced on demand and are never empty.
class Abstract_Source
  {
  public:
    Abstract_Source() noexcept = default;

  protected:
    // Produces the next chunk into `chunk`, which is empty when this function
    // is called. Derived classes may produce an empty chunk, in which case
    // this function is called again. At the end of the sequence, `false`
    // shall be returned.
    virtual
    bool
    do_read_chunk(cow_string& chunk) = 0;

  public:
    Abstract_Source(const Abstract_Source&) = delete;
    Abstract_Source& operator=(const Abstract_Source&) & = delete;
    virtual ~Abstract_Source();

    // Gets the next chunk. If the sequence has ended, `false` is returned and
    // `chunk` is left empty.
    bool
    read(cow_string& chunk);

    // Gets all remaining chunks, concatenated.
    cow_string
    read_all();
  };

}  // namespace hermes
#endif
