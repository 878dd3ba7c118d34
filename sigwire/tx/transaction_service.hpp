// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>

#include <sigwire/chain/client.hpp>
#include <sigwire/common/errors.hpp>
#include <sigwire/common/types.hpp>
#include <sigwire/infra/concurrency/awaitable_mutex.hpp>
#include <sigwire/infra/concurrency/task.hpp>
#include <sigwire/signer/signer.hpp>
#include <sigwire/tx/broadcast_manager.hpp>
#include <sigwire/tx/gas_oracle.hpp>
#include <sigwire/tx/nonce_sequencer.hpp>
#include <sigwire/tx/retry_policy.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace sigwire::tx {

//! \brief The single write path: validates a request, reserves a nonce, signs, submits and
//! drives the submission to a terminal outcome, confirming, releasing or flagging the nonce on every exit path.
//! Per sender, the steps from reservation to first submission run one request at a time, hence
//! transactions reach the chain in nonce order. Waiting for confirmation does not hold up the sender.
class TransactionService {
  public:
    TransactionService(boost::asio::any_io_executor executor, ChainId chain_id, chain::Client& chain,
                       NonceSequencer& sequencer, signer::Signer& signer, GasOracle& gas_oracle,
                       BroadcastManager& broadcaster, const RetrySettings& retry_settings);

    TransactionService(const TransactionService&) = delete;
    TransactionService& operator=(const TransactionService&) = delete;

    //! \brief Sends the transaction and waits until it is Confirmed or Failed (reverted or nonce superseded)
    //! \throws ValidationError on malformed input, before any nonce is reserved
    //! \throws SignerRejectedError when the signer refuses the request
    //! \throws ChainRejectedError when the node refuses the transaction
    //! \throws SubmissionExhaustedError when the signing or resubmission budget is exceeded
    //! \throws BroadcastTimeoutError when the chain status of the submission cannot be told, the nonce stays flagged
    Task<TransactionOutcome> send(TransactionRequest request);

    ChainId chain_id() const { return chain_id_; }

  private:
    struct Submission {
        SigningRequest request;
        RetryPolicy policy;
        bool nonce_settled{false};  // confirmed, released, flagged or resynced already
        bool maybe_sent{false};     // a submission is under way or its outcome is unknown

        ErrorContext context() const;
    };

    struct SubmitAttempt {
        enum class Result {
            kAccepted,
            kAmbiguous,  // transport failed after the payload may have reached the node
            kNotSent,
            kRejected,
        };
        Result result{Result::kAccepted};
        ChainRejection reason{ChainRejection::kOther};
        std::exception_ptr error;
    };

    void validate(const TransactionRequest& request) const;

    //! Signs with bounded retries, true in second if the signed transaction is already known to the chain
    Task<std::pair<SignedTransaction, bool>> sign(Submission& submission);

    //! Checks the chain after a signer response got lost, returns the lost transaction if it reached the chain
    Task<std::optional<SignedTransaction>> find_lost_signature(Submission& submission);

    Task<SubmitAttempt> try_submit(const SignedTransaction& transaction);
    Task<SubmissionHandle> submit(Submission& submission, const SignedTransaction& transaction);
    Task<TransactionOutcome> await_outcome(Submission& submission, const SignedTransaction& transaction,
                                           const SubmissionHandle& handle);

    ChainId chain_id_;
    chain::Client& chain_;
    NonceSequencer& sequencer_;
    signer::Signer& signer_;
    GasOracle& gas_oracle_;
    BroadcastManager& broadcaster_;
    RetrySettings retry_settings_;
    concurrency::KeyedMutex<evmc::address> lanes_;
};

}  // namespace sigwire::tx
