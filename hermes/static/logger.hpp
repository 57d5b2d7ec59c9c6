// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_STATIC_LOGGER_
#define HERMES_STATIC_LOGGER_

#include "../fwd.hpp"
namespace hermes {

class Logger
  {
  private:
    mutable plain_mutex m_conf_mutex;
    struct X_Level_Config;
    cow_vector<X_Level_Config> m_conf_levels;
    atomic_relaxed<uint32_t> m_conf_level_bits;

    mutable plain_mutex m_io_mutex;

  public:
    // Creates a logger that outputs to nowhere.
    Logger() noexcept;

  public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) & = delete;
    ~Logger();

    // Reloads configuration from 'main.conf'. In verbose mode, all levels are
    // also written to standard error.
    // If this function fails, an exception is thrown, and there is no effect.
    // This function is thread-safe.
    void
    reload(const Config_File& conf_file, bool verbose);

    // Checks whether a given level is enabled.
    // This function is thread-safe.
    ROCKET_PURE
    bool
    enabled(uint8_t level) const noexcept
      {
        return (level <= 15U) && (this->m_conf_level_bits.load() & (1U << level));
      }

    // Writes a log message to all files of its level. Errors are reported to
    // standard error and are otherwise ignored.
    // This function is thread-safe.
    void
    write(uint8_t level, const char* func, const char* file, uint32_t line,
          const cow_string& text) noexcept;
  };

}  // namespace hermes
#endif
