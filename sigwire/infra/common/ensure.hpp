// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sigwire {

//! Raise std::logic_error with the message unless condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! Internal state broken: raise std::logic_error, the message is built only on failure
//! Usage: `ensure_invariant(condition, [&]() { return "state " + to_string(state); });`
template <std::invocable MessageBuilder>
inline void ensure_invariant(bool condition, MessageBuilder&& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + std::string{message_builder()}};
    }
}

//! Caller broke the contract: raise std::invalid_argument, the message is built only on failure
template <std::invocable MessageBuilder>
inline void ensure_pre_condition(bool condition, MessageBuilder&& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument{"Pre-condition violation: " + std::string{message_builder()}};
    }
}

}  // namespace sigwire
