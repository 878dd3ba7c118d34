// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <catch2/catch_test_macros.hpp>

namespace sigwire {

using namespace evmc::literals;

TEST_CASE("classify_rejection", "[common][errors]") {
    CHECK(classify_rejection("nonce too low") == ChainRejection::kNonceTooLow);
    CHECK(classify_rejection("Nonce too low: address 0xab, tx: 3 state: 5") == ChainRejection::kNonceTooLow);
    CHECK(classify_rejection("OldNonce") == ChainRejection::kNonceTooLow);
    CHECK(classify_rejection("insufficient funds for gas * price + value") == ChainRejection::kInsufficientFunds);
    CHECK(classify_rejection("transaction underpriced") == ChainRejection::kUnderpriced);
    CHECK(classify_rejection("replacement transaction underpriced") == ChainRejection::kUnderpriced);
    CHECK(classify_rejection("max fee per gas less than block base fee") == ChainRejection::kUnderpriced);
    CHECK(classify_rejection("already known") == ChainRejection::kAlreadyKnown);
    CHECK(classify_rejection("Known transaction: 06d0669e") == ChainRejection::kAlreadyKnown);
    CHECK(classify_rejection("execution reverted") == ChainRejection::kReverted);
    CHECK(classify_rejection("intrinsic gas too low") == ChainRejection::kOther);
}

TEST_CASE("Error carries context", "[common][errors]") {
    const ErrorContext context{
        .account = 0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address,
        .nonce = 6,
        .last_state = "Sent",
    };
    const SubmissionExhaustedError error{"resubmission budget exceeded", context};
    CHECK(error.context().nonce == 6);
    CHECK(error.message() == "resubmission budget exceeded");
    CHECK(std::string{error.what()} ==
          "resubmission budget exceeded [account=0x7e5f4552091a69125d5dfcb7b8c2659029395bdf nonce=6 state=Sent]");

    const ValidationError bare{"invalid recipient"};
    CHECK(std::string{bare.what()} == "invalid recipient");
}

TEST_CASE("Error hierarchy", "[common][errors]") {
    CHECK_THROWS_AS(throw SignerUnavailableError{"timeout", true}, SignerError);
    CHECK_THROWS_AS(throw SignerRejectedError{"policy"}, SignerError);
    CHECK_THROWS_AS(throw ChainRejectedError{"nonce too low", ChainRejection::kNonceTooLow}, Error);
    CHECK_THROWS_AS(throw DeploymentFailedError{"failed", evmc::address{}}, std::runtime_error);

    const SignerUnavailableError lost{"response lost", true};
    CHECK(lost.outcome_unknown());
}

}  // namespace sigwire
