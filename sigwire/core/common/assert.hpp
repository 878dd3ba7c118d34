// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace sigwire {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

// SIGWIRE_ASSERT always aborts program execution on assertion failure, even when NDEBUG is defined.
#define SIGWIRE_ASSERT(expr)  \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::sigwire::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
