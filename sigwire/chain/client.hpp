// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/core/common/base.hpp>
#include <sigwire/core/common/bytes.hpp>
#include <sigwire/core/types/receipt.hpp>
#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire::chain {

enum class BlockTag {
    kLatest,
    kPending,
};

std::string_view to_string(BlockTag tag);

//! \brief Message call used for gas estimation
struct CallRequest {
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    intx::uint256 value{0};
    Bytes data;
};

//! \brief Error object returned by the node for a JSON-RPC request
class RpcError : public std::runtime_error {
  public:
    RpcError(int code, const std::string& message) : std::runtime_error{message}, code_{code} {}

    int code() const { return code_; }

  private:
    int code_;
};

//! \brief Chain state and submission capability consumed by the transaction and provisioning paths.
//! Methods throw RpcError when the node answers with an error and rpc::http::TransportError when it cannot be reached.
class Client {
  public:
    virtual ~Client() = default;

    virtual Task<ChainId> chain_id() = 0;

    virtual Task<uint64_t> get_transaction_count(const evmc::address& address, BlockTag tag) = 0;

    virtual Task<Bytes> get_code(const evmc::address& address) = 0;

    virtual Task<evmc::bytes32> send_raw_transaction(const Bytes& rlp) = 0;

    virtual Task<std::optional<Receipt>> get_transaction_receipt(const evmc::bytes32& hash) = 0;

    virtual Task<uint64_t> estimate_gas(const CallRequest& call) = 0;

    virtual Task<intx::uint256> max_priority_fee_per_gas() = 0;

    //! Base fee of the latest block
    virtual Task<intx::uint256> base_fee_per_gas() = 0;
};

}  // namespace sigwire::chain
