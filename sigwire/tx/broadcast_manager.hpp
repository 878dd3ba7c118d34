// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>

#include <evmc/evmc.hpp>

#include <sigwire/chain/client.hpp>
#include <sigwire/common/types.hpp>
#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire::tx {

struct BroadcastSettings {
    std::chrono::milliseconds poll_interval{2'000};
    std::chrono::milliseconds confirmation_timeout{120'000};
};

struct SubmissionHandle {
    evmc::bytes32 hash;
    evmc::address sender;
    uint64_t nonce{0};

    friend bool operator==(const SubmissionHandle&, const SubmissionHandle&) = default;
};

//! \brief Submits signed transactions and watches for their inclusion
class BroadcastManager {
  public:
    BroadcastManager(chain::Client& chain, const BroadcastSettings& settings) : chain_{chain}, settings_{settings} {}

    //! \brief Replays the signed payload exactly as given, a node already knowing it counts as accepted
    //! \throws ChainRejectedError when the node refuses the transaction
    //! \throws BroadcastTimeoutError when the payload may have reached the node but no usable reply came back
    //! \throws rpc::http::TransportError when the node could not be reached at all
    Task<SubmissionHandle> submit(const SignedTransaction& transaction);

    //! \brief Waits for inclusion, the outcome is Dropped once the confirmation timeout elapses.
    //! Failing chain queries are retried at the next poll interval.
    //! \throws BroadcastTimeoutError when the chain answers with something that cannot be interpreted
    Task<TransactionOutcome> poll(const SubmissionHandle& handle);

    //! \brief Looks once at chain state, nullopt while the transaction is neither mined nor superseded
    Task<std::optional<TransactionOutcome>> check(const SubmissionHandle& handle);

    //! \brief Same as check, a failing chain query reads as not observed yet
    //! \throws BroadcastTimeoutError when the chain answers with something that cannot be interpreted
    Task<std::optional<TransactionOutcome>> observe(const SubmissionHandle& handle);

    const BroadcastSettings& settings() const { return settings_; }

  private:
    chain::Client& chain_;
    BroadcastSettings settings_;
};

}  // namespace sigwire::tx
