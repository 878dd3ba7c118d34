// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>

namespace sigwire::tx {

enum class SubmissionState {
    kNotSent,
    kSent,
    kAwaitingConfirmation,
    kConfirmed,
    kFailed,     // rejected or reverted by the chain
    kExhausted,  // retry budget exceeded
};

std::string_view to_string(SubmissionState state);
std::ostream& operator<<(std::ostream& out, SubmissionState state);

struct RetrySettings {
    uint32_t max_sign_attempts{5};
    uint32_t max_resubmissions{3};
    std::chrono::milliseconds initial_backoff{250};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_backoff{10'000};
};

//! \brief Submission lifecycle of one logical transaction.
//! Signing may be retried only before the first submit, afterwards only the identical signed payload is replayed.
class RetryPolicy {
  public:
    explicit RetryPolicy(const RetrySettings& settings) : settings_{settings} {}

    SubmissionState state() const { return state_; }
    bool is_terminal() const;

    uint32_t sign_attempts() const { return sign_attempts_; }
    uint32_t resubmissions() const { return resubmissions_; }

    //! \brief Records a transient signer failure
    //! \return the delay before the next signing attempt, nullopt when the attempts are exhausted
    std::optional<std::chrono::milliseconds> on_signer_unavailable();

    void on_submitted();
    void on_awaiting_confirmation();
    void on_confirmed();
    void on_failed();

    //! \brief Records a confirmation timeout for a submitted transaction not observed on chain
    //! \return true if the identical transaction may be resubmitted, false when resubmissions are exhausted
    bool on_dropped();

    //! \brief Gives up without any further attempt
    void on_exhausted();

  private:
    void transition(SubmissionState to, std::initializer_list<SubmissionState> allowed_from);

    RetrySettings settings_;
    SubmissionState state_{SubmissionState::kNotSent};
    uint32_t sign_attempts_{0};
    uint32_t resubmissions_{0};
};

}  // namespace sigwire::tx
