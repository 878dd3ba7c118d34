// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "retry_policy.hpp"

#include <sstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace sigwire::tx {

using namespace std::chrono_literals;

static RetrySettings test_settings() {
    return RetrySettings{
        .max_sign_attempts = 4,
        .max_resubmissions = 2,
        .initial_backoff = 100ms,
        .backoff_multiplier = 2.0,
        .max_backoff = 300ms,
    };
}

TEST_CASE("RetryPolicy: happy path", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    CHECK(policy.state() == SubmissionState::kNotSent);
    policy.on_submitted();
    CHECK(policy.state() == SubmissionState::kSent);
    policy.on_awaiting_confirmation();
    CHECK(policy.state() == SubmissionState::kAwaitingConfirmation);
    CHECK_FALSE(policy.is_terminal());
    policy.on_confirmed();
    CHECK(policy.state() == SubmissionState::kConfirmed);
    CHECK(policy.is_terminal());
}

TEST_CASE("RetryPolicy: signer backoff", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    CHECK(policy.on_signer_unavailable() == 100ms);
    CHECK(policy.on_signer_unavailable() == 200ms);
    CHECK(policy.on_signer_unavailable() == 300ms);  // capped
    CHECK(policy.state() == SubmissionState::kNotSent);
    CHECK_FALSE(policy.on_signer_unavailable());
    CHECK(policy.state() == SubmissionState::kExhausted);
    CHECK(policy.sign_attempts() == 4);
}

TEST_CASE("RetryPolicy: signer backoff stays capped over many attempts", "[tx][retry]") {
    RetrySettings settings{test_settings()};
    settings.max_sign_attempts = 80;
    RetryPolicy policy{settings};
    for (uint32_t attempt{1}; attempt < 80; ++attempt) {
        const auto backoff{policy.on_signer_unavailable()};
        REQUIRE(backoff);
        CHECK(*backoff == (attempt <= 2 ? 100ms * attempt : 300ms));
    }
    CHECK_FALSE(policy.on_signer_unavailable());
    CHECK(policy.state() == SubmissionState::kExhausted);
}

TEST_CASE("RetryPolicy: no signing retry once submitted", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    policy.on_submitted();
    CHECK_THROWS_AS(policy.on_signer_unavailable(), std::logic_error);
}

TEST_CASE("RetryPolicy: bounded resubmissions", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    policy.on_submitted();
    policy.on_awaiting_confirmation();

    CHECK(policy.on_dropped());
    policy.on_submitted();
    CHECK(policy.on_dropped());
    policy.on_submitted();
    CHECK(policy.resubmissions() == 2);

    CHECK_FALSE(policy.on_dropped());
    CHECK(policy.state() == SubmissionState::kExhausted);
}

TEST_CASE("RetryPolicy: dropped transaction confirmed after re-check", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    policy.on_submitted();
    policy.on_awaiting_confirmation();
    CHECK(policy.on_dropped());
    policy.on_confirmed();
    CHECK(policy.state() == SubmissionState::kConfirmed);
}

TEST_CASE("RetryPolicy: terminal states are final", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    policy.on_submitted();
    policy.on_failed();
    CHECK(policy.is_terminal());
    CHECK_THROWS_AS(policy.on_confirmed(), std::logic_error);
    CHECK_THROWS_AS(policy.on_submitted(), std::logic_error);
    CHECK_THROWS_AS(policy.on_dropped(), std::logic_error);
    CHECK_THROWS_AS(policy.on_exhausted(), std::logic_error);
}

TEST_CASE("RetryPolicy: confirmation requires a submission", "[tx][retry]") {
    RetryPolicy policy{test_settings()};
    CHECK_THROWS_AS(policy.on_confirmed(), std::logic_error);
    CHECK_THROWS_AS(policy.on_awaiting_confirmation(), std::logic_error);
    policy.on_exhausted();
    CHECK(policy.state() == SubmissionState::kExhausted);
}

TEST_CASE("SubmissionState printing", "[tx][retry]") {
    std::ostringstream out;
    out << SubmissionState::kAwaitingConfirmation;
    CHECK(out.str() == "AwaitingConfirmation");
    CHECK(to_string(SubmissionState::kNotSent) == "NotSent");
}

}  // namespace sigwire::tx
