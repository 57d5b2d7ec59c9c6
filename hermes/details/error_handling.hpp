// This file is part of Hermes.
// Copyright (C) 2022-2025, LH_Mouse. All wrongs reserved.

#ifndef HERMES_DETAILS_ERROR_HANDLING_
#define HERMES_DETAILS_ERROR_HANDLING_

#include "../fwd.hpp"
namespace hermes {

using message_composer_fn = void (tinyfmt&, void*);

bool
do_is_log_enabled(uint8_t level) noexcept __attribute__((__pure__));

bool
do_push_log_message(uint8_t level, const char* func, const char* file, uint32_t line,
                    void* composer, message_composer_fn* composer_fn);

::std::runtime_error
do_create_runtime_error(const char* func, const char* file, uint32_t line,
                        void* composer, message_composer_fn* composer_fn);

}  // namespace hermes
#endif
