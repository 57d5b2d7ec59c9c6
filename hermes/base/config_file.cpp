// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "config_file.hpp"
#include "../utils.hpp"
#include <stdlib.h>
#include <asteria/utils.hpp>
#include <asteria/library/system.hpp>
namespace hermes {

Config_File::
Config_File() noexcept
  {
  }

Config_File::
Config_File(const cow_string& conf_path)
  {
    this->reload(conf_path);
  }

Config_File::
~Config_File()
  {
  }

void
Config_File::
clear() noexcept
  {
    this->m_path.clear();
    this->m_root.clear();
  }

void
Config_File::
reload(const cow_string& conf_path)
  {
    auto real_path = ::asteria::get_real_path(conf_path);
    auto real_root = ::asteria::std_system_load_conf(real_path);

    // This will not throw exceptions.
    this->m_path.swap(real_path);
    this->m_root.swap(real_root);
  }

const ::asteria::Value&
Config_File::
query(chars_view vpath) const
  {
    // A path is a sequence of names and subscripts, such as
    //   network.http.default_version
    //   logger.fatal.files[0]
    // Blank characters around names and brackets are ignored.
    const ::asteria::Value* current = nullptr;
    size_t offset = 0;

    auto skip_blanks = [&]
      {
        while((offset != vpath.n) && is_any_of(vpath.p[offset], {' ', '\t'}))
          offset ++;
      };

    auto is_name_char = [](char c, bool initial)
      {
        return ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
               || (!initial && (c >= '0') && (c <= '9'))
               || is_any_of(c, {'_', '-', '$', '@', '*'});
      };

    skip_blanks();
    if(offset == vpath.n)
      HERMES_THROW((
          "Invalid value path `$1`: empty path not allowed",
          "[in configuration file '$2']"),
          vpath, this->m_path);

    for(;;) {
      // Get a name.
      if((offset == vpath.n) || !is_name_char(vpath.p[offset], true))
        HERMES_THROW((
            "Invalid value path `$1` at offset `$2`: name expected",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      size_t name_off = offset;
      while((offset != vpath.n) && is_name_char(vpath.p[offset], false))
        offset ++;

      const ::asteria::V_object* parent;
      if(!current)
        parent = &(this->m_root);
      else if(current->is_object())
        parent = &(current->as_object());
      else
        HERMES_THROW((
            "Invalid value path `$1` at offset `$2`: invalid subscript of non-object",
            "[in configuration file '$3']"),
            vpath, name_off, this->m_path);

      current = parent->ptr(cow_string(vpath.p + name_off, offset - name_off));
      if(!current)
        return ::asteria::null;

      // Get subscripts.
      skip_blanks();
      while((offset != vpath.n) && (vpath.p[offset] == '[')) {
        offset ++;
        skip_blanks();

        size_t index_off = offset;
        uint32_t index = 0;
        while((offset != vpath.n) && (vpath.p[offset] >= '0') && (vpath.p[offset] <= '9')) {
          if(index >= 999999)
            HERMES_THROW((
                "Invalid value path `$1` at offset `$2`: integer too large",
                "[in configuration file '$3']"),
                vpath, offset, this->m_path);

          index = index * 10 + static_cast<uint32_t>(vpath.p[offset] - '0');
          offset ++;
        }

        if(offset == index_off)
          HERMES_THROW((
              "Invalid value path `$1` at offset `$2`: digit expected",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        skip_blanks();
        if((offset == vpath.n) || (vpath.p[offset] != ']'))
          HERMES_THROW((
              "Invalid value path `$1` at offset `$2`: closed bracket expected",
              "[in configuration file '$3']"),
              vpath, offset, this->m_path);

        offset ++;
        skip_blanks();

        if(!current->is_array())
          HERMES_THROW((
              "Invalid value path `$1` at offset `$2`: invalid subscript of non-array",
              "[in configuration file '$3']"),
              vpath, index_off, this->m_path);

        current = current->as_array().ptr(index);
        if(!current)
          return ::asteria::null;
      }

      if(offset == vpath.n)
        return *current;

      if(vpath.p[offset] != '.')
        HERMES_THROW((
            "Invalid value path `$1` at offset `$2`: invalid character",
            "[in configuration file '$3']"),
            vpath, offset, this->m_path);

      offset ++;
      skip_blanks();
    }
  }

int64_t
Config_File::
get_integer(chars_view vpath, int64_t min, int64_t max) const
  {
    auto qr = this->get_integer_opt(vpath, min, max);
    if(!qr)
      HERMES_THROW((
          "Missing `$1`: expecting an `integer`",
          "[in configuration file '$2']"),
          vpath, this->m_path);

    return *qr;
  }

opt<int64_t>
Config_File::
get_integer_opt(chars_view vpath, int64_t min, int64_t max) const
  {
    auto qr = this->get_integer_opt(vpath);
    if(!qr)
      return nullopt;

    if(!((*qr >= min) && (*qr <= max)))
      HERMES_THROW((
          "Invalid `$1`: value `$2` out of range [$4,$5]",
          "[in configuration file '$3']"),
          vpath, *qr, this->m_path, min, max);

    return qr;
  }

opt<int64_t>
Config_File::
get_integer_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_integer())
      HERMES_THROW((
          "Invalid `$1`: expecting an `integer`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_integer();
  }

const cow_string&
Config_File::
get_string(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(!value.is_string())
      HERMES_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

opt<cow_string>
Config_File::
get_string_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_string())
      HERMES_THROW((
          "Invalid `$1`: expecting a `string`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_string();
  }

size_t
Config_File::
get_array_size(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(!value.is_array())
      HERMES_THROW((
          "Invalid `$1`: expecting an `array`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_array().size();
  }

opt<size_t>
Config_File::
get_array_size_opt(chars_view vpath) const
  {
    const auto& value = this->query(vpath);
    if(value.is_null())
      return nullopt;

    if(!value.is_array())
      HERMES_THROW((
          "Invalid `$1`: expecting an `array`, got `$2`",
          "[in configuration file '$3']"),
          vpath, value, this->m_path);

    return value.as_array().size();
  }

}  // namespace hermes
