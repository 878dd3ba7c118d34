// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>

#include <sigwire/core/common/base.hpp>
#include <sigwire/core/tba/account.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/signer/signing_client.hpp>
#include <sigwire/tx/broadcast_manager.hpp>
#include <sigwire/tx/gas_oracle.hpp>
#include <sigwire/tx/retry_policy.hpp>

namespace sigwire {

struct ServiceSettings {
    ChainId chain_id{137};                                  // Chain the service submits to
    std::string chain_rpc_url{"http://127.0.0.1:8545"};     // JSON-RPC endpoint of the chain node
    std::string custody_url;                                // Custody signing API base URL
    std::string custody_api_key;                            // Credential presented to the custody API
    signer::CustodyAccounts custody_accounts;               // Sender address -> custody account id
    evmc::address registry{tba::kDefaultRegistry};          // ERC-6551 registry
    std::optional<evmc::address> default_implementation;    // Account implementation when none is requested
    evmc::bytes32 default_salt{tba::kDefaultSalt};          // Account salt when none is requested
    evmc::address deployer;                                 // Sender of account deployment transactions
    tx::RetrySettings retry;                                // Signing and resubmission budget
    tx::BroadcastSettings broadcast;                        // Receipt polling
    uint32_t gas_limit_margin{tx::kDefaultGasLimitMarginPercent};  // Gas limit as percentage of estimate
    std::chrono::milliseconds http_timeout{10'000};         // Per HTTP request, both endpoints
    log::Settings log_settings;                             // Logging
};

}  // namespace sigwire
