// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "service.hpp"

#include <string>
#include <utility>

#include <sigwire/chain/remote_client.hpp>
#include <sigwire/common/errors.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/rpc/http/client.hpp>
#include <sigwire/signer/http_custody_backend.hpp>

namespace sigwire {

Service::Service(boost::asio::any_io_executor executor, ServiceSettings settings, std::unique_ptr<chain::Client> chain,
                 std::unique_ptr<signer::CustodyBackend> custody)
    : settings_{std::move(settings)},
      chain_{std::move(chain)},
      custody_{std::move(custody)},
      signer_{*custody_, settings_.custody_accounts},
      nonce_sequencer_{executor, *chain_},
      gas_oracle_{*chain_, settings_.gas_limit_margin},
      broadcast_manager_{*chain_, settings_.broadcast},
      transactions_{executor, settings_.chain_id, *chain_, nonce_sequencer_, signer_,
                    gas_oracle_, broadcast_manager_, settings_.retry},
      provisioner_{executor, *chain_, transactions_, {.registry = settings_.registry, .deployer = settings_.deployer}} {}

static rpc::http::Url endpoint(std::string_view name, std::string_view url) {
    auto parsed{rpc::http::parse_url(url)};
    if (!parsed) {
        throw ValidationError{"invalid " + std::string{name} + " URL: " + std::string{url}};
    }
    return std::move(*parsed);
}

std::unique_ptr<Service> Service::connect(const boost::asio::any_io_executor& executor,
                                          const ServiceSettings& settings) {
    auto chain_http{std::make_unique<rpc::http::BeastClient>(executor, endpoint("chain RPC", settings.chain_rpc_url),
                                                             settings.http_timeout)};
    auto custody_http{std::make_unique<rpc::http::BeastClient>(executor, endpoint("custody", settings.custody_url),
                                                               settings.http_timeout)};
    return std::make_unique<Service>(
        executor, settings, std::make_unique<chain::RemoteClient>(std::move(chain_http)),
        std::make_unique<signer::HttpCustodyBackend>(std::move(custody_http), settings.custody_api_key));
}

Task<void> Service::start() {
    const ChainId chain_id{co_await chain_->chain_id()};
    if (chain_id != settings_.chain_id) {
        throw ValidationError{"chain node serves chain " + std::to_string(chain_id) + ", configured chain is " +
                              std::to_string(settings_.chain_id)};
    }
    const bool signer_available{co_await signer_.available()};
    if (!signer_available) {
        SIGW_WARN << "Service::start custody backend not available, signing requests will be retried";
    }
    SIGW_INFO << "Service::start chain_id=" << chain_id << " registry=" << settings_.registry
              << " custody_accounts=" << settings_.custody_accounts.size();
}

Task<TransactionOutcome> Service::send_transaction(const SendParameters& parameters) {
    TransactionRequest request{make_transaction_request(parameters)};
    const TransactionOutcome outcome{co_await transactions_.send(std::move(request))};
    if (outcome.status != TransactionStatus::kConfirmed) {
        SIGW_WARN << "Service::send_transaction " << outcome;
    }
    co_return outcome;
}

Task<tba::AccountAddress> Service::create_tba(const TbaParameters& parameters) {
    const tba::AccountRequest request{make_account_request(parameters, settings_)};
    co_return co_await provisioner_.ensure(request);
}

}  // namespace sigwire
