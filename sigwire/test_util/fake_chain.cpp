// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_chain.hpp"

#include <bit>
#include <cstring>
#include <stdexcept>

#include <sigwire/core/common/endian.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/rlp/decode.hpp>
#include <sigwire/core/tba/account.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/rpc/http/client.hpp>

#include <boost/asio/error.hpp>

namespace sigwire::test_util {

using rpc::http::TransportError;

// createAccount(address,bytes32,uint256,address,uint256)
static constexpr uint8_t kCreateAccountSelector[]{0x8a, 0x54, 0xc5, 0x2f};

static constexpr int kServerError{-32000};

Transaction FakeChain::decode(const Bytes& raw, evmc::address& sender) const {
    Transaction transaction;
    ByteView view{raw};
    if (!rlp::decode_transaction(view, transaction)) {
        throw chain::RpcError{kServerError, "rlp: transaction decoding failed"};
    }
    if (transaction.chain_id != intx::uint256{chain_id_}) {
        throw chain::RpcError{kServerError, "invalid chain id for signer"};
    }
    const auto recovered{transaction.recover_sender()};
    if (!recovered) {
        throw chain::RpcError{kServerError, "invalid sender"};
    }
    sender = *recovered;
    return transaction;
}

uint64_t FakeChain::mined_nonce(const evmc::address& account) const {
    const auto it{mined_nonces_.find(account)};
    return it == mined_nonces_.end() ? 0 : it->second;
}

void FakeChain::mine(const evmc::bytes32& hash, PoolEntry& entry) {
    ++block_num_;
    mined_nonces_[entry.sender] = entry.transaction.nonce + 1;
    Receipt receipt{
        .transaction_hash = hash,
        .block_num = block_num_,
        .success = !entry.revert,
        .gas_used = entry.transaction.gas_limit,
    };
    receipt.block_hash = std::bit_cast<evmc_bytes32>(keccak256(endian::to_big_compact(block_num_)));
    entry.receipt = receipt;
    if (receipt.success) {
        execute_registry_call(entry.transaction);
    }
}

void FakeChain::execute_registry_call(const Transaction& transaction) {
    const ByteView data{transaction.data};
    if (!transaction.to || data.size() != 4 + 5 * 32 || data.substr(0, 4) != ByteView{kCreateAccountSelector}) {
        return;
    }
    if (skip_deployments_) {
        return;
    }
    const ByteView args{data.substr(4)};
    const evmc::address implementation{bytes_to_address(args.substr(0, 32))};
    evmc::bytes32 salt;
    std::memcpy(salt.bytes, &args[32], 32);
    const auto chain_id{intx::be::unsafe::load<intx::uint256>(&args[64])};
    const evmc::address token_contract{bytes_to_address(args.substr(96, 32))};
    const auto token_id{intx::be::unsafe::load<intx::uint256>(&args[128])};

    const evmc::address account{
        tba::derive_account_address(*transaction.to, implementation, salt, chain_id, token_contract, token_id)};
    if (code_.contains(account)) {
        return;
    }
    code_[account] = tba::account_init_code(implementation, salt, chain_id, token_contract, token_id);
    ++deployments_;
}

evmc::bytes32 FakeChain::include(const Bytes& raw) {
    evmc::address sender;
    Transaction transaction{decode(raw, sender)};
    const evmc::bytes32 hash{transaction.hash()};
    auto& entry{pool_[hash]};
    entry.transaction = std::move(transaction);
    entry.sender = sender;
    mine(hash, entry);
    return hash;
}

bool FakeChain::is_mined(const evmc::bytes32& hash) const {
    const auto it{pool_.find(hash)};
    return it != pool_.end() && it->second.receipt.has_value();
}

Task<ChainId> FakeChain::chain_id() {
    co_return chain_id_;
}

Task<uint64_t> FakeChain::get_transaction_count(const evmc::address& address, chain::BlockTag tag) {
    uint64_t nonce{mined_nonce(address)};
    if (tag == chain::BlockTag::kPending) {
        bool found{true};
        while (found) {
            found = false;
            for (const auto& [_, entry] : pool_) {
                if (entry.sender == address && !entry.dropped && !entry.receipt && entry.transaction.nonce == nonce) {
                    ++nonce;
                    found = true;
                }
            }
        }
    }
    co_return nonce;
}

Task<Bytes> FakeChain::get_code(const evmc::address& address) {
    const auto it{code_.find(address)};
    co_return it == code_.end() ? Bytes{} : it->second;
}

Task<evmc::bytes32> FakeChain::send_raw_transaction(const Bytes& rlp) {
    ++send_attempts_;
    if (!rejections_.empty()) {
        const std::string message{rejections_.front()};
        rejections_.pop_front();
        throw chain::RpcError{kServerError, message};
    }
    std::optional<Fault> fault;
    if (!faults_.empty()) {
        fault = faults_.front();
        faults_.pop_front();
    }
    if (fault == Fault::kUnreachable) {
        throw TransportError{boost::asio::error::connection_refused, /*request_sent=*/false};
    }

    evmc::address sender;
    Transaction transaction{decode(rlp, sender)};
    const evmc::bytes32 hash{transaction.hash()};
    if (const auto known{pool_.find(hash)}; known != pool_.end() && !known->second.dropped) {
        throw chain::RpcError{kServerError, "already known"};
    }
    if (transaction.nonce < mined_nonce(sender)) {
        throw chain::RpcError{kServerError, "nonce too low"};
    }

    auto& entry{pool_[hash]};
    entry.transaction = transaction;
    entry.sender = sender;
    entry.dropped = fault == Fault::kDrop;
    entry.revert = fault == Fault::kRevert;
    entry.receipt_queries = 0;
    broadcasts_.push_back(std::move(transaction));

    if (fault == Fault::kResponseLost) {
        throw TransportError{boost::asio::error::timed_out, /*request_sent=*/true};
    }
    if (fault == Fault::kMalformedReply) {
        throw std::invalid_argument{"invalid hex string: 0xzz"};
    }
    co_return hash;
}

Task<std::optional<Receipt>> FakeChain::get_transaction_receipt(const evmc::bytes32& hash) {
    ++receipt_queries_;
    if (!receipt_faults_.empty()) {
        const QueryFault fault{receipt_faults_.front()};
        receipt_faults_.pop_front();
        switch (fault) {
            case QueryFault::kUnreachable:
                throw TransportError{boost::asio::error::connection_reset, /*request_sent=*/true};
            case QueryFault::kRpcError:
                throw chain::RpcError{kServerError, "header not found"};
            case QueryFault::kMalformed:
                throw std::invalid_argument{"invalid hex string: 0xzz"};
        }
    }
    const auto it{pool_.find(hash)};
    if (it == pool_.end() || it->second.dropped) {
        co_return std::nullopt;
    }
    auto& entry{it->second};
    if (!entry.receipt) {
        if (entry.transaction.nonce != mined_nonce(entry.sender) || entry.receipt_queries++ < blocks_to_mine_) {
            co_return std::nullopt;
        }
        mine(hash, entry);
    }
    co_return entry.receipt;
}

Task<uint64_t> FakeChain::estimate_gas(const chain::CallRequest&) {
    co_return gas_estimate_;
}

Task<intx::uint256> FakeChain::max_priority_fee_per_gas() {
    co_return priority_fee_;
}

Task<intx::uint256> FakeChain::base_fee_per_gas() {
    co_return base_fee_;
}

}  // namespace sigwire::test_util
