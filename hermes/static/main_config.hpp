// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_STATIC_MAIN_CONFIG_
#define HERMES_STATIC_MAIN_CONFIG_

#include "../fwd.hpp"
#include "../base/config_file.hpp"
namespace hermes {

class Main_Config
  {
  private:
    mutable plain_mutex m_mutex;
    Config_File m_file;

  public:
    // Constructs an empty configuration. All queries yield null values until
    // a file is loaded.
    Main_Config() noexcept;

  public:
    Main_Config(const Main_Config&) = delete;
    Main_Config& operator=(const Main_Config&) & = delete;
    ~Main_Config();

    // Reloads the configuration file from `conf_path`.
    // If this function fails, an exception is thrown, and there is no effect.
    // This function is thread-safe.
    void
    reload(const cow_string& conf_path);

    // Copies the current file.
    // Configuration files are reference-counted and cheap to copy.
    // This function is thread-safe.
    Config_File
    copy() const noexcept;

    // Copies a string. If a non-null value exists, it must be a string,
    // otherwise an exception is thrown.
    // This function is thread-safe.
    opt<cow_string>
    copy_string_opt(chars_view vpath) const;

    // Copies an integer. If a non-null value exists, it must be an integer
    // within the given range, otherwise an exception is thrown.
    // This function is thread-safe.
    opt<int64_t>
    copy_integer_opt(chars_view vpath, int64_t min, int64_t max) const;
  };

}  // namespace hermes
#endif
