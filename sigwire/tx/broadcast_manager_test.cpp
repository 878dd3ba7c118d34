// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "broadcast_manager.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sigwire/common/errors.hpp>
#include <sigwire/infra/test_util/task_runner.hpp>
#include <sigwire/rpc/http/client.hpp>
#include <sigwire/test_util/fake_chain.hpp>
#include <sigwire/test_util/local_key_backend.hpp>

namespace sigwire::tx {

using namespace evmc::literals;
using namespace std::chrono_literals;
using test_util::FakeChain;

static constexpr auto kSender{0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address};  // private key 1
static constexpr auto kRecipient{0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b_address};

static SignedTransaction signed_transfer(uint64_t nonce, uint64_t value = 100) {
    const SigningRequest request{
        .request = {
            .from = kSender,
            .to = kRecipient,
            .value = value,
            .gas = {.gas_limit = 21'000, .max_fee_per_gas = 62 * kGiga, .max_priority_fee_per_gas = 2 * kGiga},
        },
        .nonce = nonce,
        .chain_id = 137,
    };
    return test_util::sign_with_key(request, 1);
}

struct BroadcastManagerTest : public test_util::TaskRunner {
    FakeChain chain;
    BroadcastManager broadcaster{chain, BroadcastSettings{.poll_interval = 1ms, .confirmation_timeout = 20ms}};
};

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: submit and confirm", "[tx][broadcast]") {
    const SignedTransaction txn{signed_transfer(0)};
    const SubmissionHandle handle{run(broadcaster.submit(txn))};
    CHECK(handle == SubmissionHandle{.hash = txn.hash, .sender = kSender, .nonce = 0});
    REQUIRE(chain.broadcasts().size() == 1);
    CHECK(chain.broadcasts()[0].hash() == txn.hash);

    const TransactionOutcome outcome{run(broadcaster.poll(handle))};
    CHECK(outcome.status == TransactionStatus::kConfirmed);
    CHECK(outcome.nonce == 0);
    CHECK(outcome.hash == txn.hash);
    REQUIRE(outcome.receipt);
    CHECK(outcome.receipt->success);
    CHECK(outcome.receipt->transaction_hash == txn.hash);
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: waits for inclusion", "[tx][broadcast]") {
    chain.set_blocks_to_mine(3);
    const SubmissionHandle handle{run(broadcaster.submit(signed_transfer(0)))};
    CHECK(run(broadcaster.check(handle)) == std::nullopt);
    CHECK(run(broadcaster.poll(handle)).status == TransactionStatus::kConfirmed);
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: resubmission is idempotent", "[tx][broadcast]") {
    const SignedTransaction txn{signed_transfer(0)};
    const SubmissionHandle first{run(broadcaster.submit(txn))};
    const SubmissionHandle second{run(broadcaster.submit(txn))};
    CHECK(first == second);
    CHECK(chain.broadcasts().size() == 1);
    CHECK(chain.send_attempts() == 2);
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: chain rejection", "[tx][broadcast]") {
    const SignedTransaction txn{signed_transfer(0)};
    chain.reject_next("insufficient funds for gas * price + value");
    try {
        run(broadcaster.submit(txn));
        FAIL("ChainRejectedError expected");
    } catch (const ChainRejectedError& e) {
        CHECK(e.reason() == ChainRejection::kInsufficientFunds);
        CHECK(e.transaction_hash() == txn.hash);
        CHECK(e.context().nonce == 0);
        CHECK(e.context().account == kSender);
    }
    CHECK(chain.broadcasts().empty());
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: transport failures", "[tx][broadcast]") {
    const SignedTransaction txn{signed_transfer(0)};

    SECTION("node unreachable") {
        chain.fault_next(FakeChain::Fault::kUnreachable);
        CHECK_THROWS_AS(run(broadcaster.submit(txn)), rpc::http::TransportError);
        CHECK(chain.broadcasts().empty());
    }

    SECTION("response lost") {
        chain.fault_next(FakeChain::Fault::kResponseLost);
        CHECK_THROWS_AS(run(broadcaster.submit(txn)), BroadcastTimeoutError);
        // the node got it anyway
        const SubmissionHandle handle{.hash = txn.hash, .sender = kSender, .nonce = 0};
        CHECK(run(broadcaster.poll(handle)).status == TransactionStatus::kConfirmed);
    }

    SECTION("undecodable reply") {
        chain.fault_next(FakeChain::Fault::kMalformedReply);
        try {
            run(broadcaster.submit(txn));
            FAIL("BroadcastTimeoutError expected");
        } catch (const BroadcastTimeoutError& e) {
            CHECK(e.context().nonce == 0);
            CHECK(e.context().account == kSender);
        }
        CHECK(chain.broadcasts().size() == 1);
    }
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: failing receipt queries", "[tx][broadcast]") {
    const SubmissionHandle handle{run(broadcaster.submit(signed_transfer(0)))};

    SECTION("retried until the transaction shows up") {
        chain.fault_next_receipt_query(FakeChain::QueryFault::kUnreachable);
        chain.fault_next_receipt_query(FakeChain::QueryFault::kRpcError);
        CHECK(run(broadcaster.observe(handle)) == std::nullopt);
        CHECK(run(broadcaster.poll(handle)).status == TransactionStatus::kConfirmed);
        CHECK(chain.receipt_queries() == 3);
    }

    SECTION("undecodable reply") {
        chain.fault_next_receipt_query(FakeChain::QueryFault::kMalformed);
        try {
            run(broadcaster.poll(handle));
            FAIL("BroadcastTimeoutError expected");
        } catch (const BroadcastTimeoutError& e) {
            CHECK(e.context().nonce == 0);
            CHECK(e.context().last_state == "AwaitingConfirmation");
        }
    }

    SECTION("check passes the failure on") {
        chain.fault_next_receipt_query(FakeChain::QueryFault::kUnreachable);
        CHECK_THROWS_AS(run(broadcaster.check(handle)), rpc::http::TransportError);
    }
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: reverted", "[tx][broadcast]") {
    chain.fault_next(FakeChain::Fault::kRevert);
    const SubmissionHandle handle{run(broadcaster.submit(signed_transfer(0)))};
    const TransactionOutcome outcome{run(broadcaster.poll(handle))};
    CHECK(outcome.status == TransactionStatus::kFailed);
    CHECK(outcome.reason == "execution reverted");
    REQUIRE(outcome.receipt);
    CHECK_FALSE(outcome.receipt->success);
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: dropped", "[tx][broadcast]") {
    chain.fault_next(FakeChain::Fault::kDrop);
    const SubmissionHandle handle{run(broadcaster.submit(signed_transfer(0)))};
    const TransactionOutcome outcome{run(broadcaster.poll(handle))};
    CHECK(outcome.status == TransactionStatus::kDropped);
    CHECK(outcome.is_terminal());
    CHECK_FALSE(outcome.receipt);
}

TEST_CASE_METHOD(BroadcastManagerTest, "BroadcastManager: nonce consumed by another transaction", "[tx][broadcast]") {
    chain.fault_next(FakeChain::Fault::kDrop);
    const SubmissionHandle handle{run(broadcaster.submit(signed_transfer(0)))};
    chain.include(signed_transfer(0, 999).raw);

    const auto outcome{run(broadcaster.check(handle))};
    REQUIRE(outcome);
    CHECK(outcome->status == TransactionStatus::kFailed);
    CHECK(outcome->reason == "nonce consumed by another transaction");
}

}  // namespace sigwire::tx
