// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "provisioner.hpp"

#include <exception>
#include <string>
#include <utility>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/log.hpp>

namespace sigwire::tba {

Provisioner::Provisioner(boost::asio::any_io_executor executor, chain::Client& chain,
                         tx::TransactionService& transactions, const ProvisionerSettings& settings)
    : chain_{chain}, transactions_{transactions}, settings_{settings}, locks_{std::move(executor)} {}

evmc::address Provisioner::derive(const AccountRequest& request) const {
    return derive_account_address(settings_.registry, request.implementation, request.salt, request.chain_id,
                                  request.token_contract, request.token_id);
}

Task<bool> Provisioner::has_code(const evmc::address& account) {
    const Bytes code{co_await chain_.get_code(account)};
    co_return !code.empty();
}

Task<AccountAddress> Provisioner::lookup(const AccountRequest& request) {
    const evmc::address account{derive(request)};
    co_return AccountAddress{.address = account, .deployed = co_await has_code(account)};
}

Task<AccountAddress> Provisioner::ensure(const AccountRequest& request) {
    const evmc::address account{derive(request)};
    auto guard = co_await locks_.lock(account);

    std::string failure;
    ErrorContext context{.account = settings_.deployer, .last_state = "NotSent"};
    try {
        if (co_await has_code(account)) {
            SIGW_INFO << "Provisioner::ensure account=" << account << " already deployed";
            co_return AccountAddress{.address = account, .deployed = true};
        }

        SIGW_INFO << "Provisioner::ensure deploying account=" << account << " token_contract=" << request.token_contract
                  << " token_id=" << intx::to_string(request.token_id) << " implementation=" << request.implementation;
        TransactionRequest deployment{
            .from = settings_.deployer,
            .to = settings_.registry,
            .data = create_account_calldata(request.implementation, request.salt, request.chain_id,
                                            request.token_contract, request.token_id),
        };
        const TransactionOutcome outcome{co_await transactions_.send(std::move(deployment))};
        context.nonce = outcome.nonce;
        context.last_state = std::string{to_string(outcome.status)};

        if (outcome.status != TransactionStatus::kConfirmed) {
            failure = "createAccount transaction " + to_hex(ByteView{outcome.hash.bytes}, true) +
                      " failed: " + outcome.reason;
        } else if (!co_await has_code(account)) {
            failure = "no code at " + address_to_hex(account) + " after createAccount transaction " +
                      to_hex(ByteView{outcome.hash.bytes}, true);
        } else {
            SIGW_INFO << "Provisioner::ensure deployed account=" << account << " hash=" << outcome.hash;
            co_return AccountAddress{.address = account, .deployed = true, .deployment_hash = outcome.hash};
        }
    } catch (const Error& e) {
        failure = e.message();
        context = e.context();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    SIGW_ERROR << "Provisioner::ensure account=" << account << " not deployed: " << failure;
    throw DeploymentFailedError{"deployment of " + address_to_checksum_hex(account) + " failed: " + failure, account,
                                context};
}

}  // namespace sigwire::tba
