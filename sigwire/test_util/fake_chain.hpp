// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sigwire/chain/client.hpp>
#include <sigwire/core/types/transaction.hpp>

namespace sigwire::test_util {

//! \brief In-memory chain: decodes submitted transactions, mines them when their receipt is first asked for
//! and executes registry createAccount calls. Single-threaded use only.
class FakeChain : public chain::Client {
  public:
    enum class Fault {
        kUnreachable,     // transport failure before the transaction reaches the node
        kResponseLost,    // transaction accepted, then transport failure
        kDrop,            // transaction accepted, then evicted from the pool
        kRevert,          // transaction mined with failed status
        kMalformedReply,  // transaction accepted, then a reply that cannot be decoded
    };

    enum class QueryFault {
        kUnreachable,  // transport failure
        kRpcError,     // node answers with a JSON-RPC error
        kMalformed,    // node answers with something that cannot be decoded
    };

    explicit FakeChain(ChainId chain_id = 137) : chain_id_{chain_id} {}

    void set_nonce(const evmc::address& account, uint64_t nonce) { mined_nonces_[account] = nonce; }
    void set_code(const evmc::address& account, Bytes code) { code_[account] = std::move(code); }

    //! Next submission is refused by the node with this error message
    void reject_next(std::string message) { rejections_.push_back(std::move(message)); }
    void fault_next(Fault fault) { faults_.push_back(fault); }
    void fault_next_receipt_query(QueryFault fault) { receipt_faults_.push_back(fault); }

    //! Receipt queries answered with nothing before a pending transaction gets mined
    void set_blocks_to_mine(uint64_t receipt_queries) { blocks_to_mine_ = receipt_queries; }

    //! Registry calls get mined without deploying any code
    void skip_deployments(bool skip) { skip_deployments_ = skip; }

    void set_gas_estimate(uint64_t gas) { gas_estimate_ = gas; }
    void set_base_fee(const intx::uint256& fee) { base_fee_ = fee; }
    void set_priority_fee(const intx::uint256& fee) { priority_fee_ = fee; }

    //! Mines a signed transaction submitted by someone else
    evmc::bytes32 include(const Bytes& raw);

    //! Transactions accepted through send_raw_transaction, in order
    const std::vector<Transaction>& broadcasts() const { return broadcasts_; }
    size_t send_attempts() const { return send_attempts_; }
    size_t receipt_queries() const { return receipt_queries_; }
    size_t deployments() const { return deployments_; }
    bool is_mined(const evmc::bytes32& hash) const;

    Task<ChainId> chain_id() override;
    Task<uint64_t> get_transaction_count(const evmc::address& address, chain::BlockTag tag) override;
    Task<Bytes> get_code(const evmc::address& address) override;
    Task<evmc::bytes32> send_raw_transaction(const Bytes& rlp) override;
    Task<std::optional<Receipt>> get_transaction_receipt(const evmc::bytes32& hash) override;
    Task<uint64_t> estimate_gas(const chain::CallRequest& call) override;
    Task<intx::uint256> max_priority_fee_per_gas() override;
    Task<intx::uint256> base_fee_per_gas() override;

  private:
    struct PoolEntry {
        Transaction transaction;
        evmc::address sender;
        bool dropped{false};
        bool revert{false};
        uint64_t receipt_queries{0};
        std::optional<Receipt> receipt;
    };

    Transaction decode(const Bytes& raw, evmc::address& sender) const;
    uint64_t mined_nonce(const evmc::address& account) const;
    void mine(const evmc::bytes32& hash, PoolEntry& entry);
    void execute_registry_call(const Transaction& transaction);

    ChainId chain_id_;
    std::map<evmc::address, uint64_t> mined_nonces_;
    std::map<evmc::address, Bytes> code_;
    std::map<evmc::bytes32, PoolEntry> pool_;
    std::vector<Transaction> broadcasts_;
    std::deque<std::string> rejections_;
    std::deque<Fault> faults_;
    std::deque<QueryFault> receipt_faults_;
    uint64_t blocks_to_mine_{0};
    bool skip_deployments_{false};
    uint64_t gas_estimate_{21'000};
    intx::uint256 base_fee_{30 * kGiga};
    intx::uint256 priority_fee_{2 * kGiga};
    BlockNum block_num_{1'000};
    size_t send_attempts_{0};
    size_t receipt_queries_{0};
    size_t deployments_{0};
};

}  // namespace sigwire::test_util
