// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "nonce_sequencer.hpp"

#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <sigwire/infra/concurrency/sleep.hpp>
#include <sigwire/infra/test_util/task_runner.hpp>
#include <sigwire/test_util/fake_chain.hpp>
#include <sigwire/test_util/mock_chain_client.hpp>

namespace sigwire::tx {

using namespace evmc::literals;
using namespace std::chrono_literals;
using testing::_;
using testing::Invoke;

static constexpr auto kAlice{0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address};
static constexpr auto kBob{0x2b5ad5c4795c026514f8317c7a215e218dccd6cf_address};

static Task<uint64_t> slow_nonce(uint64_t nonce) {
    co_await sleep(5ms);
    co_return nonce;
}

struct NonceSequencerTest : public test_util::TaskRunner {
    test_util::FakeChain chain;
    NonceSequencer sequencer{executor(), chain};
};

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::reserve", "[tx][nonce]") {
    chain.set_nonce(kAlice, 6);

    SECTION("seeds from chain pending nonce") {
        CHECK(run(sequencer.reserve(kAlice)) == 6);
        CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 6});
    }

    SECTION("strictly increasing") {
        CHECK(run(sequencer.reserve(kAlice)) == 6);
        CHECK(run(sequencer.reserve(kAlice)) == 7);
        CHECK(run(sequencer.reserve(kAlice)) == 8);
    }

    SECTION("independent accounts") {
        CHECK(run(sequencer.reserve(kAlice)) == 6);
        CHECK(run(sequencer.reserve(kBob)) == 0);
        CHECK(run(sequencer.reserve(kAlice)) == 7);
        CHECK(run(sequencer.reserve(kBob)) == 1);
    }

    SECTION("chain is read only once") {
        chain.set_nonce(kAlice, 100);  // ignored once seeded
        CHECK(run(sequencer.reserve(kAlice)) == 100);
        chain.set_nonce(kAlice, 3);
        CHECK(run(sequencer.reserve(kAlice)) == 101);
    }
}

TEST_CASE("NonceSequencer::reserve concurrent", "[tx][nonce]") {
    test_util::TaskRunner runner;
    test_util::MockChainClient chain;
    NonceSequencer sequencer{runner.executor(), chain};

    EXPECT_CALL(chain, get_transaction_count(kAlice, chain::BlockTag::kPending))
        .WillOnce(Invoke([](const evmc::address&, chain::BlockTag) { return slow_nonce(6); }));

    std::vector<std::future<uint64_t>> futures;
    for (int i{0}; i < 5; ++i) {
        futures.push_back(runner.spawn_future(sequencer.reserve(kAlice)));
    }
    std::set<uint64_t> nonces;
    for (auto& future : futures) {
        runner.poll_context_until_future_is_ready(future);
        nonces.insert(future.get());
    }
    CHECK(nonces == std::set<uint64_t>{6, 7, 8, 9, 10});
    CHECK(sequencer.state(kAlice).last_assigned == 10);
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::confirm", "[tx][nonce]") {
    chain.set_nonce(kAlice, 5);
    CHECK_THROWS_AS(run(sequencer.confirm(kAlice, 5)), std::invalid_argument);

    CHECK(run(sequencer.reserve(kAlice)) == 5);
    CHECK(run(sequencer.reserve(kAlice)) == 6);
    run(sequencer.confirm(kAlice, 6));
    CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 6, .last_confirmed = 6});

    // out of order confirmation never moves last_confirmed backwards
    run(sequencer.confirm(kAlice, 5));
    CHECK(sequencer.state(kAlice).last_confirmed == 6);

    CHECK_THROWS_AS(run(sequencer.confirm(kAlice, 7)), std::invalid_argument);
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::release", "[tx][nonce]") {
    chain.set_nonce(kAlice, 10);

    SECTION("highest reservation rolls back") {
        CHECK(run(sequencer.reserve(kAlice)) == 10);
        CHECK(run(sequencer.reserve(kAlice)) == 11);
        CHECK(run(sequencer.release(kAlice, 11)) == ReleaseResult::kRolledBack);
        CHECK(sequencer.state(kAlice).last_assigned == 10);
        CHECK(run(sequencer.reserve(kAlice)) == 11);
        CHECK(sequencer.gaps(kAlice).empty());
    }

    SECTION("lower reservation becomes a gap") {
        CHECK(run(sequencer.reserve(kAlice)) == 10);
        CHECK(run(sequencer.reserve(kAlice)) == 11);
        CHECK(run(sequencer.release(kAlice, 10)) == ReleaseResult::kGapRecorded);
        CHECK(sequencer.gaps(kAlice) == std::vector<uint64_t>{10});
        CHECK(run(sequencer.reserve(kAlice)) == 12);
    }

    SECTION("rolling back absorbs contiguous gaps") {
        for (uint64_t expected{10}; expected <= 13; ++expected) {
            CHECK(run(sequencer.reserve(kAlice)) == expected);
        }
        CHECK(run(sequencer.release(kAlice, 11)) == ReleaseResult::kGapRecorded);
        CHECK(run(sequencer.release(kAlice, 12)) == ReleaseResult::kGapRecorded);
        CHECK(run(sequencer.release(kAlice, 13)) == ReleaseResult::kRolledBack);
        CHECK(sequencer.state(kAlice).last_assigned == 10);
        CHECK(sequencer.gaps(kAlice).empty());
    }

    SECTION("releasing the only reservation reseeds from chain") {
        chain.set_nonce(kBob, 0);
        CHECK(run(sequencer.reserve(kBob)) == 0);
        CHECK(run(sequencer.release(kBob, 0)) == ReleaseResult::kRolledBack);
        CHECK_FALSE(sequencer.state(kBob).last_assigned);
        CHECK(run(sequencer.reserve(kBob)) == 0);
    }

    SECTION("not outstanding") {
        CHECK_THROWS_AS(run(sequencer.release(kAlice, 10)), std::invalid_argument);
        CHECK(run(sequencer.reserve(kAlice)) == 10);
        CHECK(run(sequencer.reserve(kAlice)) == 11);
        CHECK_THROWS_AS(run(sequencer.release(kAlice, 12)), std::invalid_argument);
        run(sequencer.confirm(kAlice, 10));
        CHECK_THROWS_AS(run(sequencer.release(kAlice, 10)), std::invalid_argument);
        CHECK(run(sequencer.release(kAlice, 11)) == ReleaseResult::kRolledBack);
        CHECK_THROWS_AS(run(sequencer.release(kAlice, 11)), std::invalid_argument);
    }
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::reconcile", "[tx][nonce]") {
    chain.set_nonce(kAlice, 20);
    for (uint64_t expected{20}; expected <= 24; ++expected) {
        CHECK(run(sequencer.reserve(kAlice)) == expected);
    }
    CHECK(run(sequencer.release(kAlice, 20)) == ReleaseResult::kGapRecorded);
    CHECK(run(sequencer.release(kAlice, 22)) == ReleaseResult::kGapRecorded);
    run(sequencer.flag_unresolved(kAlice, 21));
    run(sequencer.flag_unresolved(kAlice, 23));
    CHECK(sequencer.unresolved(kAlice) == std::vector<uint64_t>{21, 23});

    // Nonces 20 and 21 got consumed meanwhile
    chain.set_nonce(kAlice, 22);
    CHECK(run(sequencer.reconcile(kAlice)) == std::vector<uint64_t>{22});
    CHECK(sequencer.gaps(kAlice) == std::vector<uint64_t>{22});
    CHECK(sequencer.unresolved(kAlice) == std::vector<uint64_t>{23});
    CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 24, .last_confirmed = 21});
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::reconcile external usage", "[tx][nonce]") {
    chain.set_nonce(kAlice, 3);
    CHECK(run(sequencer.reserve(kAlice)) == 3);
    chain.set_nonce(kAlice, 8);
    CHECK(run(sequencer.reconcile(kAlice)).empty());
    CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 7, .last_confirmed = 7});
    CHECK(run(sequencer.reserve(kAlice)) == 8);
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::resync", "[tx][nonce]") {
    chain.set_nonce(kAlice, 3);
    for (uint64_t expected{3}; expected <= 6; ++expected) {
        CHECK(run(sequencer.reserve(kAlice)) == expected);
    }
    CHECK(run(sequencer.release(kAlice, 3)) == ReleaseResult::kGapRecorded);
    CHECK(run(sequencer.release(kAlice, 5)) == ReleaseResult::kGapRecorded);
    run(sequencer.flag_unresolved(kAlice, 4));

    // Nonce 3 used by another transaction, nothing of ours in the pool
    chain.set_nonce(kAlice, 4);
    run(sequencer.resync(kAlice));
    CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 3, .last_confirmed = 3});
    CHECK(sequencer.gaps(kAlice).empty());
    CHECK(sequencer.unresolved(kAlice) == std::vector<uint64_t>{4});

    // A submission still in flight gets confirmed above the realigned nonce
    run(sequencer.confirm(kAlice, 6));
    CHECK(sequencer.state(kAlice) == NonceState{.last_assigned = 6, .last_confirmed = 6});
    CHECK(run(sequencer.reserve(kAlice)) == 7);
}

TEST_CASE_METHOD(NonceSequencerTest, "NonceSequencer::resync unknown account", "[tx][nonce]") {
    run(sequencer.resync(kBob));
    CHECK(sequencer.state(kBob) == NonceState{});
    chain.set_nonce(kBob, 9);
    CHECK(run(sequencer.reserve(kBob)) == 9);
}

}  // namespace sigwire::tx
