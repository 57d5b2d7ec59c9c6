// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_source.hpp"
#include "../utils.hpp"
namespace hermes {

Abstract_Source::
~Abstract_Source()
  {
  }

bool
Abstract_Source::
read(cow_string& chunk)
  {
    for(;;) {
      chunk.clear();
      if(!this->do_read_chunk(chunk)) {
        chunk.clear();
        return false;
      }

      if(!chunk.empty())
        return true;
    }
  }

cow_string
Abstract_Source::
read_all()
  {
    cow_string data, chunk;
    while(this->read(chunk))
      data.append(chunk);
    return data;
  }

}  // namespace hermes
