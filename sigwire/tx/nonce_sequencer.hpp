// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <evmc/evmc.hpp>

#include <sigwire/chain/client.hpp>
#include <sigwire/infra/concurrency/awaitable_mutex.hpp>
#include <sigwire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace sigwire::tx {

//! \brief Per-account nonce bookkeeping.
//! Invariant: last_assigned >= last_confirmed when both are set.
struct NonceState {
    std::optional<uint64_t> last_assigned;
    std::optional<uint64_t> last_confirmed;

    friend bool operator==(const NonceState&, const NonceState&) = default;
};

enum class ReleaseResult {
    kRolledBack,   // the nonce was the highest reservation and is free again
    kGapRecorded,  // a higher nonce was reserved meanwhile, the released one is a gap
};

//! \brief Issues strictly increasing nonces per account.
//! Reservations for one account are serialized, reservations for distinct accounts never contend.
class NonceSequencer {
  public:
    NonceSequencer(boost::asio::any_io_executor executor, chain::Client& chain);

    NonceSequencer(const NonceSequencer&) = delete;
    NonceSequencer& operator=(const NonceSequencer&) = delete;

    //! \brief Returns last_assigned + 1, seeding from the chain pending nonce for an unknown account
    Task<uint64_t> reserve(const evmc::address& account);

    //! \brief Records that the nonce has been consumed on chain.
    //! After a resync, a nonce above the re-read last_assigned is accepted as well.
    //! \throws std::invalid_argument if the nonce has never been assigned
    Task<void> confirm(const evmc::address& account, uint64_t nonce);

    //! \brief Gives back a nonce that has definitely not been submitted
    //! \throws std::invalid_argument if the nonce is not an outstanding reservation
    Task<ReleaseResult> release(const evmc::address& account, uint64_t nonce);

    //! \brief Marks a nonce whose submission outcome is unknown, to be resolved by reconcile
    Task<void> flag_unresolved(const evmc::address& account, uint64_t nonce);

    //! \brief Realigns last_assigned to the chain pending nonce after the node refused a nonce as too low.
    //! Confirmations, open gaps and flagged nonces of submissions still in flight are kept.
    Task<void> resync(const evmc::address& account);

    //! \brief Re-reads the chain nonce, drops gaps and flags it has consumed and returns the gaps still open
    Task<std::vector<uint64_t>> reconcile(const evmc::address& account);

    NonceState state(const evmc::address& account) const;
    std::vector<uint64_t> gaps(const evmc::address& account) const;
    std::vector<uint64_t> unresolved(const evmc::address& account) const;

  private:
    struct AccountNonces {
        NonceState state;
        std::set<uint64_t> gaps;
        std::set<uint64_t> unresolved;
        bool resynced{false};
    };

    chain::Client& chain_;
    concurrency::KeyedMutex<evmc::address> locks_;
    mutable std::mutex accounts_mutex_;
    std::map<evmc::address, AccountNonces> accounts_;
};

}  // namespace sigwire::tx
