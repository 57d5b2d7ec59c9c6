// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "main_config.hpp"
namespace hermes {

Main_Config::
Main_Config() noexcept
  {
  }

Main_Config::
~Main_Config()
  {
  }

void
Main_Config::
reload(const cow_string& conf_path)
  {
    // Read the file.
    Config_File file;
    file.reload(conf_path);

    // Set up new data.
    plain_mutex::unique_lock lock(this->m_mutex);
    this->m_file.swap(file);
  }

Config_File
Main_Config::
copy() const noexcept
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    return this->m_file;
  }

opt<cow_string>
Main_Config::
copy_string_opt(chars_view vpath) const
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    return this->m_file.get_string_opt(vpath);
  }

opt<int64_t>
Main_Config::
copy_integer_opt(chars_view vpath, int64_t min, int64_t max) const
  {
    plain_mutex::unique_lock lock(this->m_mutex);
    return this->m_file.get_integer_opt(vpath, min, max);
  }

}  // namespace hermes
