// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "broadcast_manager.hpp"

#include <exception>
#include <string>
#include <utility>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/infra/concurrency/sleep.hpp>
#include <sigwire/rpc/http/client.hpp>

#include <boost/system/system_error.hpp>

namespace sigwire::tx {

static TransactionOutcome make_outcome(const SubmissionHandle& handle, TransactionStatus status,
                                       std::string reason = {}) {
    return TransactionOutcome{
        .status = status,
        .reason = std::move(reason),
        .nonce = handle.nonce,
        .hash = handle.hash,
    };
}

Task<SubmissionHandle> BroadcastManager::submit(const SignedTransaction& transaction) {
    const SubmissionHandle handle{
        .hash = transaction.hash,
        .sender = transaction.sender,
        .nonce = transaction.nonce(),
    };
    const ErrorContext context{.account = handle.sender, .nonce = handle.nonce, .last_state = "NotSent"};

    try {
        const evmc::bytes32 hash{co_await chain_.send_raw_transaction(transaction.raw)};
        if (hash != transaction.hash) {
            SIGW_WARN << "BroadcastManager::submit node reported hash=" << hash << " expected=" << transaction.hash;
        }
    } catch (const chain::RpcError& e) {
        const ChainRejection reason{classify_rejection(e.what())};
        if (reason != ChainRejection::kAlreadyKnown) {
            SIGW_WARN << "BroadcastManager::submit rejected hash=" << handle.hash << " nonce=" << handle.nonce
                      << " error=" << e.what();
            throw ChainRejectedError{e.what(), reason, handle.hash, context};
        }
        SIGW_DEBUG << "BroadcastManager::submit hash=" << handle.hash << " already known";
    } catch (const rpc::http::TransportError& e) {
        if (!e.request_sent()) {
            throw;
        }
        SIGW_WARN << "BroadcastManager::submit outcome unknown hash=" << handle.hash << " error=" << e.what();
        throw BroadcastTimeoutError{std::string{"broadcast outcome unknown: "} + e.what(), context};
    } catch (const boost::system::system_error&) {
        throw;
    } catch (const std::exception& e) {
        // Request written and answered, but the reply is unusable
        SIGW_WARN << "BroadcastManager::submit outcome unknown hash=" << handle.hash << " malformed reply: " << e.what();
        throw BroadcastTimeoutError{std::string{"broadcast outcome unknown: "} + e.what(), context};
    }

    SIGW_INFO << "BroadcastManager::submit sender=" << handle.sender << " nonce=" << handle.nonce
              << " hash=" << handle.hash;
    co_return handle;
}

Task<std::optional<TransactionOutcome>> BroadcastManager::check(const SubmissionHandle& handle) {
    auto receipt{co_await chain_.get_transaction_receipt(handle.hash)};
    if (!receipt) {
        const uint64_t chain_nonce{co_await chain_.get_transaction_count(handle.sender, chain::BlockTag::kLatest)};
        if (chain_nonce <= handle.nonce) {
            co_return std::nullopt;
        }
        // Nonce consumed: either mined right now or superseded by another transaction
        receipt = co_await chain_.get_transaction_receipt(handle.hash);
        if (!receipt) {
            SIGW_WARN << "BroadcastManager::check nonce=" << handle.nonce << " consumed by another transaction"
                      << " hash=" << handle.hash;
            co_return make_outcome(handle, TransactionStatus::kFailed, "nonce consumed by another transaction");
        }
    }

    TransactionOutcome outcome{make_outcome(handle, receipt->success ? TransactionStatus::kConfirmed
                                                                     : TransactionStatus::kFailed)};
    if (!receipt->success) {
        outcome.reason = "execution reverted";
    }
    outcome.receipt = std::move(receipt);
    co_return outcome;
}

Task<std::optional<TransactionOutcome>> BroadcastManager::observe(const SubmissionHandle& handle) {
    std::optional<TransactionOutcome> outcome;
    try {
        outcome = co_await check(handle);
    } catch (const chain::RpcError& e) {
        SIGW_WARN << "BroadcastManager::observe hash=" << handle.hash << " chain query failed: " << e.what();
    } catch (const rpc::http::TransportError& e) {
        SIGW_WARN << "BroadcastManager::observe hash=" << handle.hash << " chain unreachable: " << e.what();
    } catch (const boost::system::system_error&) {
        throw;
    } catch (const std::exception& e) {
        SIGW_ERROR << "BroadcastManager::observe hash=" << handle.hash << " malformed reply: " << e.what();
        throw BroadcastTimeoutError{
            std::string{"transaction status unknown: "} + e.what(),
            ErrorContext{.account = handle.sender, .nonce = handle.nonce, .last_state = "AwaitingConfirmation"}};
    }
    co_return outcome;
}

Task<TransactionOutcome> BroadcastManager::poll(const SubmissionHandle& handle) {
    const auto deadline{std::chrono::steady_clock::now() + settings_.confirmation_timeout};
    while (true) {
        if (auto outcome{co_await observe(handle)}) {
            SIGW_INFO << "BroadcastManager::poll " << *outcome;
            co_return std::move(*outcome);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        co_await sleep(settings_.poll_interval);
    }
    SIGW_WARN << "BroadcastManager::poll hash=" << handle.hash << " not mined within "
              << settings_.confirmation_timeout.count() << "ms";
    co_return make_outcome(handle, TransactionStatus::kDropped, "confirmation timeout");
}

}  // namespace sigwire::tx
