// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_service.hpp"

#include <string>
#include <utility>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/ensure.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/infra/concurrency/sleep.hpp>
#include <sigwire/rpc/http/client.hpp>

#include <boost/asio/this_coro.hpp>

namespace sigwire::tx {

//! Intrinsic gas of a plain transfer
static constexpr uint64_t kMinGasLimit{21'000};

ErrorContext TransactionService::Submission::context() const {
    return {
        .account = request.request.from,
        .nonce = request.nonce,
        .last_state = std::string{to_string(policy.state())},
    };
}

TransactionService::TransactionService(boost::asio::any_io_executor executor, ChainId chain_id, chain::Client& chain,
                                       NonceSequencer& sequencer, signer::Signer& signer, GasOracle& gas_oracle,
                                       BroadcastManager& broadcaster, const RetrySettings& retry_settings)
    : chain_id_{chain_id},
      chain_{chain},
      sequencer_{sequencer},
      signer_{signer},
      gas_oracle_{gas_oracle},
      broadcaster_{broadcaster},
      retry_settings_{retry_settings},
      lanes_{std::move(executor)} {}

void TransactionService::validate(const TransactionRequest& request) const {
    const ErrorContext context{.account = request.from, .last_state = "NotSent"};
    if (request.from == evmc::address{}) {
        throw ValidationError{"sender is the zero address", context};
    }
    const GasParameters& gas{request.gas};
    if (gas.gas_limit && *gas.gas_limit < kMinGasLimit) {
        throw ValidationError{"gas limit " + std::to_string(*gas.gas_limit) + " below intrinsic gas", context};
    }
    if (request.type == TransactionType::kLegacy && gas.max_priority_fee_per_gas) {
        throw ValidationError{"priority fee is not applicable to legacy transactions", context};
    }
    if (gas.max_fee_per_gas && gas.max_priority_fee_per_gas && *gas.max_priority_fee_per_gas > *gas.max_fee_per_gas) {
        throw ValidationError{"max priority fee per gas exceeds max fee per gas", context};
    }
}

Task<TransactionOutcome> TransactionService::send(TransactionRequest request) {
    validate(request);

    auto lane = co_await lanes_.lock(request.from);

    request.gas = co_await gas_oracle_.complete(request);
    const evmc::address sender{request.from};
    const uint64_t nonce{co_await sequencer_.reserve(sender)};
    SIGW_INFO << "TransactionService::send from=" << sender << " to=" << request.to
              << " value=" << intx::to_string(request.value) << " nonce=" << nonce;

    Submission submission{
        .request = SigningRequest{.request = std::move(request), .nonce = nonce, .chain_id = chain_id_},
        .policy = RetryPolicy{retry_settings_},
    };

    SignedTransaction transaction;
    SubmissionHandle handle;
    std::exception_ptr failure;
    try {
        auto [signed_txn, on_chain] = co_await sign(submission);
        transaction = std::move(signed_txn);
        if (on_chain) {
            handle = SubmissionHandle{.hash = transaction.hash, .sender = sender, .nonce = nonce};
        } else {
            handle = co_await submit(submission, transaction);
        }
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure) {
        if (!submission.nonce_settled) {
            co_await boost::asio::this_coro::reset_cancellation_state();
            if (submission.maybe_sent) {
                SIGW_WARN << "TransactionService::send submission outcome unknown, flagging nonce=" << nonce
                          << " of " << sender << " state=" << submission.policy.state();
                co_await sequencer_.flag_unresolved(sender, nonce);
            } else {
                SIGW_WARN << "TransactionService::send releasing nonce=" << nonce << " of " << sender
                          << " state=" << submission.policy.state();
                co_await sequencer_.release(sender, nonce);
            }
        }
        std::rethrow_exception(failure);
    }
    submission.policy.on_submitted();
    lane.unlock();

    TransactionOutcome outcome;
    try {
        outcome = co_await await_outcome(submission, transaction, handle);
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure) {
        if (!submission.nonce_settled) {
            SIGW_ERROR << "TransactionService: lost track of nonce=" << nonce << " of " << sender
                       << " hash=" << handle.hash << " state=" << submission.policy.state();
            co_await boost::asio::this_coro::reset_cancellation_state();
            co_await sequencer_.flag_unresolved(sender, nonce);
        }
        std::rethrow_exception(failure);
    }
    co_return outcome;
}

Task<std::pair<SignedTransaction, bool>> TransactionService::sign(Submission& submission) {
    while (true) {
        std::optional<SignedTransaction> signed_txn;
        std::string error;
        bool outcome_unknown{false};
        try {
            signed_txn = co_await signer_.sign(submission.request);
        } catch (const SignerUnavailableError& e) {
            error = e.what();
            outcome_unknown = e.outcome_unknown();
        }
        if (signed_txn) {
            SIGW_DEBUG << "TransactionService::sign nonce=" << submission.request.nonce << " hash=" << signed_txn->hash;
            co_return std::pair{std::move(*signed_txn), false};
        }

        SIGW_WARN << "TransactionService::sign signer unavailable nonce=" << submission.request.nonce
                  << " outcome_unknown=" << outcome_unknown << " error=" << error;
        if (outcome_unknown) {
            if (auto lost{co_await find_lost_signature(submission)}) {
                co_return std::pair{std::move(*lost), true};
            }
        }

        const auto backoff{submission.policy.on_signer_unavailable()};
        if (!backoff) {
            throw SubmissionExhaustedError{
                "signer unavailable after " + std::to_string(submission.policy.sign_attempts()) + " attempts: " + error,
                submission.context()};
        }
        co_await sleep(*backoff);
    }
}

Task<std::optional<SignedTransaction>> TransactionService::find_lost_signature(Submission& submission) {
    const evmc::address& sender{submission.request.request.from};
    const uint64_t nonce{submission.request.nonce};

    const uint64_t chain_nonce{co_await chain_.get_transaction_count(sender, chain::BlockTag::kPending)};
    if (chain_nonce <= nonce) {
        // Not on chain: signing the identical content again is safe
        co_return std::nullopt;
    }

    auto lost{co_await signer_.recover(submission.request)};
    if (lost) {
        SIGW_INFO << "TransactionService: signature whose response was lost is on chain nonce=" << nonce
                  << " hash=" << lost->hash;
        co_return lost;
    }

    // Someone else used the nonce
    co_await sequencer_.reconcile(sender);
    submission.nonce_settled = true;
    submission.policy.on_failed();
    throw ChainRejectedError{"nonce " + std::to_string(nonce) + " consumed by another transaction",
                             ChainRejection::kNonceTooLow, std::nullopt, submission.context()};
}

Task<TransactionService::SubmitAttempt> TransactionService::try_submit(const SignedTransaction& transaction) {
    SubmitAttempt attempt;
    try {
        co_await broadcaster_.submit(transaction);
    } catch (const ChainRejectedError& e) {
        attempt.result = SubmitAttempt::Result::kRejected;
        attempt.reason = e.reason();
        attempt.error = std::current_exception();
    } catch (const BroadcastTimeoutError&) {
        attempt.result = SubmitAttempt::Result::kAmbiguous;
        attempt.error = std::current_exception();
    } catch (const rpc::http::TransportError&) {
        attempt.result = SubmitAttempt::Result::kNotSent;
        attempt.error = std::current_exception();
    }
    co_return attempt;
}

Task<SubmissionHandle> TransactionService::submit(Submission& submission, const SignedTransaction& transaction) {
    const evmc::address& sender{submission.request.request.from};
    const uint64_t nonce{submission.request.nonce};
    const SubmissionHandle handle{.hash = transaction.hash, .sender = sender, .nonce = nonce};

    uint32_t attempts{0};
    while (true) {
        submission.maybe_sent = true;
        const SubmitAttempt attempt{co_await try_submit(transaction)};
        switch (attempt.result) {
            case SubmitAttempt::Result::kAccepted:
                co_return handle;
            case SubmitAttempt::Result::kAmbiguous:
                // Watch it as if accepted, a drop leads to resubmission of the identical payload
                co_return handle;
            case SubmitAttempt::Result::kRejected:
                submission.maybe_sent = false;
                submission.policy.on_failed();
                if (attempt.reason == ChainRejection::kNonceTooLow) {
                    co_await sequencer_.resync(sender);
                } else {
                    co_await sequencer_.release(sender, nonce);
                }
                submission.nonce_settled = true;
                std::rethrow_exception(attempt.error);
            case SubmitAttempt::Result::kNotSent:
                submission.maybe_sent = false;
                break;
        }
        if (++attempts > retry_settings_.max_resubmissions) {
            submission.policy.on_exhausted();
            throw SubmissionExhaustedError{"chain unreachable after " + std::to_string(attempts) + " submissions",
                                           submission.context()};
        }
        SIGW_WARN << "TransactionService::submit node unreachable, retrying nonce=" << nonce;
        co_await sleep(retry_settings_.initial_backoff);
    }
}

Task<TransactionOutcome> TransactionService::await_outcome(Submission& submission, const SignedTransaction& transaction,
                                                           const SubmissionHandle& handle) {
    const evmc::address& sender{submission.request.request.from};
    const uint64_t nonce{submission.request.nonce};
    RetryPolicy& policy{submission.policy};

    while (true) {
        if (policy.state() == SubmissionState::kSent) {
            policy.on_awaiting_confirmation();
        }

        TransactionOutcome outcome{co_await broadcaster_.poll(handle)};
        if (outcome.status == TransactionStatus::kDropped) {
            // Last look at chain state before any resubmission
            if (auto observed{co_await broadcaster_.observe(handle)}) {
                outcome = std::move(*observed);
            }
        }

        switch (outcome.status) {
            case TransactionStatus::kConfirmed:
                policy.on_confirmed();
                co_await sequencer_.confirm(sender, nonce);
                submission.nonce_settled = true;
                SIGW_INFO << "TransactionService: confirmed " << outcome;
                co_return outcome;
            case TransactionStatus::kFailed:
                policy.on_failed();
                if (outcome.receipt) {
                    co_await sequencer_.confirm(sender, nonce);
                } else {
                    co_await sequencer_.reconcile(sender);
                }
                submission.nonce_settled = true;
                SIGW_WARN << "TransactionService: failed " << outcome;
                co_return outcome;
            case TransactionStatus::kDropped:
                break;
            case TransactionStatus::kPending:
                ensure_invariant(false, [&]() {
                    return "poll returned a pending outcome for nonce " + std::to_string(nonce);
                });
        }

        if (!policy.on_dropped()) {
            co_await sequencer_.flag_unresolved(sender, nonce);
            submission.nonce_settled = true;
            throw SubmissionExhaustedError{
                "transaction " + to_hex(ByteView{handle.hash.bytes}, true) + " not mined after " +
                    std::to_string(policy.resubmissions()) + " resubmissions",
                submission.context()};
        }
        SIGW_INFO << "TransactionService: resubmitting identical transaction nonce=" << nonce
                  << " hash=" << handle.hash << " resubmission=" << policy.resubmissions();
        const SubmitAttempt attempt{co_await try_submit(transaction)};
        if (attempt.result == SubmitAttempt::Result::kRejected && attempt.reason != ChainRejection::kNonceTooLow) {
            policy.on_failed();
            co_await sequencer_.flag_unresolved(sender, nonce);
            submission.nonce_settled = true;
            std::rethrow_exception(attempt.error);
        }
        // Nonce too low means it got consumed meanwhile, the next poll tells by which transaction
        policy.on_submitted();
    }
}

}  // namespace sigwire::tx
