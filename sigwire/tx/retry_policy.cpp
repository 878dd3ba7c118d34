// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <magic_enum.hpp>

#include <sigwire/infra/common/ensure.hpp>
#include <sigwire/infra/common/log.hpp>

namespace sigwire::tx {

std::string_view to_string(SubmissionState state) {
    return magic_enum::enum_name(state).substr(1);
}

std::ostream& operator<<(std::ostream& out, SubmissionState state) {
    return out << to_string(state);
}

bool RetryPolicy::is_terminal() const {
    return state_ == SubmissionState::kConfirmed || state_ == SubmissionState::kFailed ||
           state_ == SubmissionState::kExhausted;
}

void RetryPolicy::transition(SubmissionState to, std::initializer_list<SubmissionState> allowed_from) {
    const bool allowed{std::find(allowed_from.begin(), allowed_from.end(), state_) != allowed_from.end()};
    ensure_invariant(allowed, [&]() {
        return "RetryPolicy: invalid transition " + std::string{to_string(state_)} + " -> " +
               std::string{to_string(to)};
    });
    SIGW_TRACE << "RetryPolicy: " << state_ << " -> " << to;
    state_ = to;
}

std::optional<std::chrono::milliseconds> RetryPolicy::on_signer_unavailable() {
    ensure_invariant(state_ == SubmissionState::kNotSent, [&]() {
        return "RetryPolicy: signing retry in state " + std::string{to_string(state_)};
    });
    ++sign_attempts_;
    if (sign_attempts_ >= settings_.max_sign_attempts) {
        transition(SubmissionState::kExhausted, {SubmissionState::kNotSent});
        return std::nullopt;
    }
    const double factor{std::pow(settings_.backoff_multiplier, static_cast<double>(sign_attempts_ - 1))};
    // Cap before converting to an integer count
    const double backoff{std::min(static_cast<double>(settings_.initial_backoff.count()) * factor,
                                  static_cast<double>(settings_.max_backoff.count()))};
    return std::chrono::milliseconds{static_cast<int64_t>(backoff)};
}

void RetryPolicy::on_submitted() {
    transition(SubmissionState::kSent, {SubmissionState::kNotSent, SubmissionState::kAwaitingConfirmation});
}

void RetryPolicy::on_awaiting_confirmation() {
    transition(SubmissionState::kAwaitingConfirmation, {SubmissionState::kSent});
}

void RetryPolicy::on_confirmed() {
    transition(SubmissionState::kConfirmed, {SubmissionState::kSent, SubmissionState::kAwaitingConfirmation});
}

void RetryPolicy::on_failed() {
    transition(SubmissionState::kFailed,
               {SubmissionState::kNotSent, SubmissionState::kSent, SubmissionState::kAwaitingConfirmation});
}

bool RetryPolicy::on_dropped() {
    if (resubmissions_ >= settings_.max_resubmissions) {
        transition(SubmissionState::kExhausted, {SubmissionState::kSent, SubmissionState::kAwaitingConfirmation});
        return false;
    }
    transition(SubmissionState::kAwaitingConfirmation,
               {SubmissionState::kSent, SubmissionState::kAwaitingConfirmation});
    ++resubmissions_;
    return true;
}

void RetryPolicy::on_exhausted() {
    transition(SubmissionState::kExhausted,
               {SubmissionState::kNotSent, SubmissionState::kSent, SubmissionState::kAwaitingConfirmation});
}

}  // namespace sigwire::tx
