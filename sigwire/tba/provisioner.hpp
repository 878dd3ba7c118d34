// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/chain/client.hpp>
#include <sigwire/core/tba/account.hpp>
#include <sigwire/infra/concurrency/awaitable_mutex.hpp>
#include <sigwire/infra/concurrency/task.hpp>
#include <sigwire/tx/transaction_service.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace sigwire::tba {

//! \brief Token bound account to provision: the owning token plus the account parameters
struct AccountRequest {
    evmc::address token_contract;
    intx::uint256 token_id{0};
    evmc::address implementation;
    intx::uint256 chain_id{0};  // chain the owning token lives on
    evmc::bytes32 salt{kDefaultSalt};

    friend bool operator==(const AccountRequest&, const AccountRequest&) = default;
};

struct AccountAddress {
    evmc::address address;
    bool deployed{false};
    std::optional<evmc::bytes32> deployment_hash;  // set when this call deployed the account
};

struct ProvisionerSettings {
    evmc::address registry{kDefaultRegistry};
    evmc::address deployer;  // sender of createAccount transactions
};

//! \brief Creates token bound accounts exactly once: existing code at the derived address short-circuits any deployment
class Provisioner {
  public:
    Provisioner(boost::asio::any_io_executor executor, chain::Client& chain, tx::TransactionService& transactions,
                const ProvisionerSettings& settings);

    Provisioner(const Provisioner&) = delete;
    Provisioner& operator=(const Provisioner&) = delete;

    evmc::address derive(const AccountRequest& request) const;

    //! \brief Derives the address and reads its deployment status, never deploys
    Task<AccountAddress> lookup(const AccountRequest& request);

    //! \brief Returns the deployed account, deploying it through the registry if absent
    //! \throws DeploymentFailedError when the account is not deployed and deploying it failed, safe to call again
    Task<AccountAddress> ensure(const AccountRequest& request);

    const ProvisionerSettings& settings() const { return settings_; }

  private:
    Task<bool> has_code(const evmc::address& account);

    chain::Client& chain_;
    tx::TransactionService& transactions_;
    ProvisionerSettings settings_;
    concurrency::KeyedMutex<evmc::address> locks_;
};

}  // namespace sigwire::tba
