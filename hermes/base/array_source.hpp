// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_BASE_ARRAY_SOURCE_
#define HERMES_BASE_ARRAY_SOURCE_

#include "../fwd.hpp"
#include "abstract_source.hpp"
namespace hermes {

// This source yields strings from a vector, in order.
class Array_Source
  : public Abstract_Source
  {
  private:
    cow_vector<cow_string> m_chunks;
    size_t m_next = 0;

  protected:
    bool
    do_read_chunk(cow_string& chunk) override;

  public:
    explicit
    Array_Source(const cow_vector<cow_string>& chunks) noexcept
      :
        m_chunks(chunks)
      { }

  public:
    Array_Source(const Array_Source&) = delete;
    Array_Source& operator=(const Array_Source&) & = delete;
    virtual ~Array_Source();
  };

}  // namespace hermes
#endif
