// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "service.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/test_util/task_runner.hpp>
#include <sigwire/test_util/fake_chain.hpp>
#include <sigwire/test_util/local_key_backend.hpp>

namespace sigwire {

using namespace evmc::literals;
using namespace std::chrono_literals;
using test_util::FakeChain;
using test_util::LocalKeyBackend;

static constexpr auto kImplementation{0x41c8f39463a868d3a88af00cd0fe7102f30e44ec_address};
static constexpr auto kCollection{0x2222222222222222222222222222222222222222_address};

struct ServiceTest : public test_util::TaskRunner {
    ServiceTest() {
        auto fake_chain{std::make_unique<FakeChain>(137)};
        auto local_backend{std::make_unique<LocalKeyBackend>()};
        chain = fake_chain.get();
        backend = local_backend.get();
        sender = backend->add_key("treasury", 1);
        deployer = backend->add_key("deployer", 2);

        ServiceSettings settings;
        settings.chain_id = 137;
        settings.custody_accounts = {{sender, "treasury"}, {deployer, "deployer"}};
        settings.default_implementation = kImplementation;
        settings.deployer = deployer;
        settings.retry = {.max_sign_attempts = 2, .max_resubmissions = 1, .initial_backoff = 1ms, .max_backoff = 1ms};
        settings.broadcast = {.poll_interval = 1ms, .confirmation_timeout = 20ms};
        service = std::make_unique<Service>(executor(), settings, std::move(fake_chain), std::move(local_backend));
    }

    FakeChain* chain{nullptr};
    LocalKeyBackend* backend{nullptr};
    evmc::address sender;
    evmc::address deployer;
    std::unique_ptr<Service> service;
};

TEST_CASE_METHOD(ServiceTest, "Service::start", "[service]") {
    CHECK_NOTHROW(run(service->start()));
}

TEST_CASE("Service::start on another chain", "[service]") {
    test_util::TaskRunner runner;
    ServiceSettings settings;
    settings.chain_id = 1;
    Service service{runner.executor(), settings, std::make_unique<FakeChain>(137), std::make_unique<LocalKeyBackend>()};
    CHECK_THROWS_AS(runner.run(service.start()), ValidationError);
}

TEST_CASE_METHOD(ServiceTest, "Service::send_transaction", "[service]") {
    chain->set_nonce(sender, 6);
    const TransactionOutcome outcome{run(service->send_transaction({
        .from = address_to_checksum_hex(sender),
        .to = "0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b",
        .value = "100",
    }))};
    CHECK(outcome.status == TransactionStatus::kConfirmed);
    CHECK(outcome.nonce == 6);
    CHECK(chain->is_mined(outcome.hash));
    REQUIRE(chain->broadcasts().size() == 1);
    CHECK(chain->broadcasts()[0].value == 100);
    CHECK(chain->broadcasts()[0].data.empty());
    CHECK(service->nonce_sequencer().state(sender) == tx::NonceState{.last_assigned = 6, .last_confirmed = 6});
}

TEST_CASE_METHOD(ServiceTest, "Service::send_transaction malformed recipient", "[service]") {
    CHECK_THROWS_AS(run(service->send_transaction({
                        .from = address_to_hex(sender),
                        .to = "0xb94f5374fce5edbc8e2a8697c1533167",
                        .value = "100",
                    })),
                    ValidationError);
    CHECK(service->nonce_sequencer().state(sender) == tx::NonceState{});
    CHECK(chain->send_attempts() == 0);
    CHECK(backend->requests_received() == 0);
}

TEST_CASE_METHOD(ServiceTest, "Service::send_transaction unknown sender", "[service]") {
    CHECK_THROWS_AS(run(service->send_transaction({
                        .from = "0x3333333333333333333333333333333333333333",
                        .to = "0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b",
                    })),
                    ValidationError);
    CHECK(chain->send_attempts() == 0);
}

TEST_CASE_METHOD(ServiceTest, "Service::create_tba", "[service]") {
    const TbaParameters parameters{.collection = address_to_hex(kCollection), .token_id = "7"};
    const evmc::address expected{derive_tba(parameters, service->settings())};

    const tba::AccountAddress first{run(service->create_tba(parameters))};
    CHECK(first.address == expected);
    CHECK(first.deployed);
    CHECK(chain->deployments() == 1);
    CHECK(chain->broadcasts().size() == 1);

    const tba::AccountAddress second{run(service->create_tba(parameters))};
    CHECK(second.address == expected);
    CHECK(chain->broadcasts().size() == 1);
    CHECK(chain->send_attempts() == 1);
}

TEST_CASE_METHOD(ServiceTest, "Service::create_tba deployment failure", "[service]") {
    chain->fault_next(FakeChain::Fault::kRevert);
    const TbaParameters parameters{.collection = address_to_hex(kCollection), .token_id = "7"};
    CHECK_THROWS_AS(run(service->create_tba(parameters)), DeploymentFailedError);
    CHECK(chain->deployments() == 0);
    CHECK_THROWS_AS(run(service->create_tba({.collection = "0x22", .token_id = "7"})), ValidationError);
}

}  // namespace sigwire
