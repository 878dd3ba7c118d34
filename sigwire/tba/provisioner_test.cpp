// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "provisioner.hpp"

#include <future>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <sigwire/infra/test_util/task_runner.hpp>
#include <sigwire/signer/signing_client.hpp>
#include <sigwire/test_util/fake_chain.hpp>
#include <sigwire/test_util/local_key_backend.hpp>
#include <sigwire/test_util/mock_chain_client.hpp>

namespace sigwire::tba {

using namespace evmc::literals;
using namespace std::chrono_literals;
using test_util::FakeChain;
using testing::_;
using testing::Invoke;

static constexpr auto kCollection{0x2222222222222222222222222222222222222222_address};
static constexpr auto kImplementation{0x41c8f39463a868d3a88af00cd0fe7102f30e44ec_address};
static constexpr ChainId kChainId{137};

static Task<Bytes> undecodable_code() {
    throw std::invalid_argument{"invalid hex string: 0x363d3z"};
    co_return Bytes{};
}

struct ProvisionerTest : public test_util::TaskRunner {
    AccountRequest request(uint64_t token_id = 7) const {
        return AccountRequest{
            .token_contract = kCollection,
            .token_id = token_id,
            .implementation = kImplementation,
            .chain_id = kChainId,
        };
    }

    FakeChain chain{kChainId};
    test_util::LocalKeyBackend backend;
    evmc::address deployer{backend.add_key("deployer", 2)};
    signer::SigningClient signing_client{backend, {{deployer, "deployer"}}};
    tx::NonceSequencer sequencer{executor(), chain};
    tx::GasOracle gas_oracle{chain};
    tx::BroadcastManager broadcaster{chain, {.poll_interval = 1ms, .confirmation_timeout = 20ms}};
    tx::TransactionService transactions{
        executor(),
        kChainId,
        chain,
        sequencer,
        signing_client,
        gas_oracle,
        broadcaster,
        {.max_sign_attempts = 2, .max_resubmissions = 1, .initial_backoff = 1ms, .max_backoff = 1ms},
    };
    Provisioner provisioner{executor(), chain, transactions, {.registry = kDefaultRegistry, .deployer = deployer}};
};

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure deploys once", "[tba]") {
    const evmc::address expected{derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, kChainId,
                                                         kCollection, 7)};
    CHECK(provisioner.derive(request()) == expected);
    CHECK_FALSE(run(provisioner.lookup(request())).deployed);

    const AccountAddress first{run(provisioner.ensure(request()))};
    CHECK(first.address == expected);
    CHECK(first.deployed);
    CHECK(first.deployment_hash);
    CHECK(chain.deployments() == 1);
    REQUIRE(chain.broadcasts().size() == 1);
    CHECK(chain.broadcasts()[0].to == kDefaultRegistry);
    CHECK(chain.broadcasts()[0].data ==
          create_account_calldata(kImplementation, kDefaultSalt, kChainId, kCollection, 7));

    const AccountAddress second{run(provisioner.ensure(request()))};
    CHECK(second.address == expected);
    CHECK(second.deployed);
    CHECK_FALSE(second.deployment_hash);
    CHECK(chain.broadcasts().size() == 1);
    CHECK(chain.deployments() == 1);
    CHECK(run(provisioner.lookup(request())).deployed);
}

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure existing code", "[tba]") {
    chain.set_code(provisioner.derive(request()), *from_hex("363d3d373d3d3d363d73"));
    const AccountAddress account{run(provisioner.ensure(request()))};
    CHECK(account.deployed);
    CHECK(chain.send_attempts() == 0);
    CHECK(backend.requests_received() == 0);
}

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure concurrent callers", "[tba]") {
    auto first{spawn_future(provisioner.ensure(request()))};
    auto second{spawn_future(provisioner.ensure(request()))};
    auto other{spawn_future(provisioner.ensure(request(8)))};
    poll_context_until_future_is_ready(first);
    poll_context_until_future_is_ready(second);
    poll_context_until_future_is_ready(other);

    CHECK(first.get().address == second.get().address);
    CHECK(other.get().address != provisioner.derive(request()));
    CHECK(chain.deployments() == 2);
    CHECK(chain.broadcasts().size() == 2);
}

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure failures", "[tba]") {
    const evmc::address expected{provisioner.derive(request())};

    SECTION("reverted") {
        chain.fault_next(FakeChain::Fault::kRevert);
        try {
            run(provisioner.ensure(request()));
            FAIL("DeploymentFailedError expected");
        } catch (const DeploymentFailedError& e) {
            CHECK(e.account_address() == expected);
            CHECK(e.context().account == deployer);
            CHECK(e.context().last_state == "Failed");
        }
        CHECK_FALSE(run(provisioner.lookup(request())).deployed);
    }

    SECTION("no code after confirmation") {
        chain.skip_deployments(true);
        CHECK_THROWS_AS(run(provisioner.ensure(request())), DeploymentFailedError);
        chain.skip_deployments(false);
    }

    SECTION("signer refuses") {
        backend.fail_next(test_util::LocalKeyBackend::Failure::kRejected);
        CHECK_THROWS_AS(run(provisioner.ensure(request())), DeploymentFailedError);
        CHECK(chain.send_attempts() == 0);
    }

    // Retriable later
    const AccountAddress account{run(provisioner.ensure(request()))};
    CHECK(account.address == expected);
    CHECK(account.deployed);
    CHECK(chain.deployments() == 1);
}

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure deployment status unknown", "[tba]") {
    chain.fault_next_receipt_query(FakeChain::QueryFault::kMalformed);
    try {
        run(provisioner.ensure(request()));
        FAIL("DeploymentFailedError expected");
    } catch (const DeploymentFailedError& e) {
        CHECK(e.account_address() == provisioner.derive(request()));
        CHECK(e.context().account == deployer);
        CHECK(e.context().nonce == 0);
    }
    CHECK(sequencer.unresolved(deployer) == std::vector<uint64_t>{0});
}

TEST_CASE_METHOD(ProvisionerTest, "Provisioner::ensure undecodable code lookup", "[tba]") {
    test_util::MockChainClient code_source;
    EXPECT_CALL(code_source, get_code(_)).WillOnce(Invoke([](const evmc::address&) { return undecodable_code(); }));
    Provisioner checked{executor(), code_source, transactions, {.registry = kDefaultRegistry, .deployer = deployer}};

    try {
        run(checked.ensure(request()));
        FAIL("DeploymentFailedError expected");
    } catch (const DeploymentFailedError& e) {
        CHECK(e.account_address() == provisioner.derive(request()));
        CHECK(e.context().last_state == "NotSent");
    }
    CHECK(chain.send_attempts() == 0);
}

}  // namespace sigwire::tba
