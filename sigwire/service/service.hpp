// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <evmc/evmc.hpp>

#include <sigwire/chain/client.hpp>
#include <sigwire/common/types.hpp>
#include <sigwire/infra/concurrency/task.hpp>
#include <sigwire/service/request.hpp>
#include <sigwire/service/settings.hpp>
#include <sigwire/signer/custody_backend.hpp>
#include <sigwire/signer/signing_client.hpp>
#include <sigwire/tba/provisioner.hpp>
#include <sigwire/tx/broadcast_manager.hpp>
#include <sigwire/tx/gas_oracle.hpp>
#include <sigwire/tx/nonce_sequencer.hpp>
#include <sigwire/tx/transaction_service.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace sigwire {

//! \brief Entry point of the library: owns one instance of every component, wired over the chain and custody clients
class Service {
  public:
    Service(boost::asio::any_io_executor executor, ServiceSettings settings, std::unique_ptr<chain::Client> chain,
            std::unique_ptr<signer::CustodyBackend> custody);

    //! \brief Builds a service speaking JSON-RPC to the chain node and HTTP to the custody API
    //! \throws ValidationError if an endpoint URL is malformed
    static std::unique_ptr<Service> connect(const boost::asio::any_io_executor& executor,
                                            const ServiceSettings& settings);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    //! \brief Checks the node serves the configured chain and probes the custody backend
    Task<void> start();

    //! \brief Signs, submits and follows a transaction until it is mined
    //! \details Malformed parameters are refused before any nonce is reserved
    Task<TransactionOutcome> send_transaction(const SendParameters& parameters);

    //! \brief Returns the token bound account for the token, deploying it if absent
    Task<tba::AccountAddress> create_tba(const TbaParameters& parameters);

    const ServiceSettings& settings() const { return settings_; }
    tx::NonceSequencer& nonce_sequencer() { return nonce_sequencer_; }

  private:
    ServiceSettings settings_;
    std::unique_ptr<chain::Client> chain_;
    std::unique_ptr<signer::CustodyBackend> custody_;
    signer::SigningClient signer_;
    tx::NonceSequencer nonce_sequencer_;
    tx::GasOracle gas_oracle_;
    tx::BroadcastManager broadcast_manager_;
    tx::TransactionService transactions_;
    tba::Provisioner provisioner_;
};

}  // namespace sigwire
