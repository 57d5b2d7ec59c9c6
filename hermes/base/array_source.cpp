// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "array_source.hpp"
namespace hermes {

Array_Source::
~Array_Source()
  {
  }

bool
Array_Source::
do_read_chunk(cow_string& chunk)
  {
    if(this->m_next >= this->m_chunks.size())
      return false;

    chunk = this->m_chunks[this->m_next];
    this->m_next ++;
    return true;
  }

}  // namespace hermes
