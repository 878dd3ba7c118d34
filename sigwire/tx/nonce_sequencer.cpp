// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "nonce_sequencer.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/ensure.hpp>
#include <sigwire/infra/common/log.hpp>

namespace sigwire::tx {

NonceSequencer::NonceSequencer(boost::asio::any_io_executor executor, chain::Client& chain)
    : chain_{chain}, locks_{std::move(executor)} {}

Task<uint64_t> NonceSequencer::reserve(const evmc::address& account) {
    auto guard = co_await locks_.lock(account);

    NonceState current{state(account)};
    uint64_t nonce{0};
    if (current.last_assigned) {
        nonce = *current.last_assigned + 1;
    } else {
        nonce = co_await chain_.get_transaction_count(account, chain::BlockTag::kPending);
        if (current.last_confirmed) {
            nonce = std::max(nonce, *current.last_confirmed + 1);
        }
        SIGW_DEBUG << "NonceSequencer::reserve seeded account=" << account << " from chain pending nonce=" << nonce;
    }

    {
        std::scoped_lock lock{accounts_mutex_};
        accounts_[account].state.last_assigned = nonce;
    }
    SIGW_DEBUG << "NonceSequencer::reserve account=" << account << " nonce=" << nonce;
    co_return nonce;
}

Task<void> NonceSequencer::confirm(const evmc::address& account, uint64_t nonce) {
    auto guard = co_await locks_.lock(account);

    std::scoped_lock lock{accounts_mutex_};
    auto& nonces{accounts_[account]};
    auto& current{nonces.state};
    ensure_pre_condition(nonces.resynced || (current.last_assigned && nonce <= *current.last_assigned), [&]() {
        return "confirming nonce " + std::to_string(nonce) + " never assigned to " + address_to_hex(account);
    });
    current.last_assigned = std::max(nonce, current.last_assigned.value_or(0));
    current.last_confirmed = std::max(nonce, current.last_confirmed.value_or(0));
    nonces.gaps.erase(nonce);
    nonces.unresolved.erase(nonce);
    SIGW_DEBUG << "NonceSequencer::confirm account=" << account << " nonce=" << nonce;
}

Task<ReleaseResult> NonceSequencer::release(const evmc::address& account, uint64_t nonce) {
    auto guard = co_await locks_.lock(account);

    std::scoped_lock lock{accounts_mutex_};
    auto& nonces{accounts_[account]};
    auto& current{nonces.state};
    ensure_pre_condition(current.last_assigned && nonce <= *current.last_assigned &&
                             (!current.last_confirmed || nonce > *current.last_confirmed) &&
                             !nonces.gaps.contains(nonce),
                         [&]() {
                             return "releasing nonce " + std::to_string(nonce) + " not outstanding for " +
                                    address_to_hex(account);
                         });

    if (nonce != *current.last_assigned) {
        nonces.gaps.insert(nonce);
        SIGW_WARN << "NonceSequencer::release account=" << account << " nonce=" << nonce
                  << " recorded as gap below last_assigned=" << *current.last_assigned;
        co_return ReleaseResult::kGapRecorded;
    }

    // Roll back, absorbing contiguous gaps right below
    uint64_t first_free{nonce};
    while (first_free > 0 && nonces.gaps.contains(first_free - 1)) {
        nonces.gaps.erase(first_free - 1);
        --first_free;
    }
    if (first_free == 0) {
        current.last_assigned.reset();
    } else {
        current.last_assigned = first_free - 1;
    }
    SIGW_DEBUG << "NonceSequencer::release account=" << account << " nonce=" << nonce
               << " rolled back, next=" << first_free;
    co_return ReleaseResult::kRolledBack;
}

Task<void> NonceSequencer::flag_unresolved(const evmc::address& account, uint64_t nonce) {
    auto guard = co_await locks_.lock(account);

    std::scoped_lock lock{accounts_mutex_};
    accounts_[account].unresolved.insert(nonce);
    SIGW_WARN << "NonceSequencer::flag_unresolved account=" << account << " nonce=" << nonce;
}

Task<void> NonceSequencer::resync(const evmc::address& account) {
    auto guard = co_await locks_.lock(account);

    const uint64_t mined{co_await chain_.get_transaction_count(account, chain::BlockTag::kLatest)};
    const uint64_t pending{co_await chain_.get_transaction_count(account, chain::BlockTag::kPending)};

    std::scoped_lock lock{accounts_mutex_};
    auto& nonces{accounts_[account]};
    auto& current{nonces.state};
    if (mined > 0 && (!current.last_confirmed || *current.last_confirmed < mined - 1)) {
        current.last_confirmed = mined - 1;
    }
    const uint64_t next{std::max(pending, current.last_confirmed ? *current.last_confirmed + 1 : 0)};
    if (next > 0) {
        current.last_assigned = next - 1;
    } else {
        current.last_assigned.reset();
    }
    // Gaps at or above next are handed out again, gaps below the mined nonce got consumed
    std::erase_if(nonces.gaps, [&](uint64_t gap) { return gap < mined || gap >= next; });
    std::erase_if(nonces.unresolved, [&](uint64_t flagged) { return flagged < mined; });
    nonces.resynced = true;
    SIGW_INFO << "NonceSequencer::resync account=" << account << " mined=" << mined << " pending=" << pending
              << " unresolved=" << nonces.unresolved.size();
}

Task<std::vector<uint64_t>> NonceSequencer::reconcile(const evmc::address& account) {
    auto guard = co_await locks_.lock(account);

    const uint64_t chain_nonce = co_await chain_.get_transaction_count(account, chain::BlockTag::kLatest);

    std::scoped_lock lock{accounts_mutex_};
    auto& nonces{accounts_[account]};
    std::erase_if(nonces.gaps, [&](uint64_t gap) { return gap < chain_nonce; });
    std::erase_if(nonces.unresolved, [&](uint64_t flagged) { return flagged < chain_nonce; });
    if (chain_nonce > 0) {
        const uint64_t mined{chain_nonce - 1};
        if (!nonces.state.last_confirmed || *nonces.state.last_confirmed < mined) {
            nonces.state.last_confirmed = mined;
        }
        if (!nonces.state.last_assigned || *nonces.state.last_assigned < mined) {
            // Nonces used outside this service
            nonces.state.last_assigned = mined;
        }
    }
    SIGW_DEBUG << "NonceSequencer::reconcile account=" << account << " chain_nonce=" << chain_nonce
               << " open_gaps=" << nonces.gaps.size() << " unresolved=" << nonces.unresolved.size();
    co_return std::vector<uint64_t>{nonces.gaps.begin(), nonces.gaps.end()};
}

NonceState NonceSequencer::state(const evmc::address& account) const {
    std::scoped_lock lock{accounts_mutex_};
    const auto it{accounts_.find(account)};
    return it == accounts_.end() ? NonceState{} : it->second.state;
}

std::vector<uint64_t> NonceSequencer::gaps(const evmc::address& account) const {
    std::scoped_lock lock{accounts_mutex_};
    const auto it{accounts_.find(account)};
    if (it == accounts_.end()) return {};
    return {it->second.gaps.begin(), it->second.gaps.end()};
}

std::vector<uint64_t> NonceSequencer::unresolved(const evmc::address& account) const {
    std::scoped_lock lock{accounts_mutex_};
    const auto it{accounts_.find(account)};
    if (it == accounts_.end()) return {};
    return {it->second.unresolved.begin(), it->second.unresolved.end()};
}

}  // namespace sigwire::tx
