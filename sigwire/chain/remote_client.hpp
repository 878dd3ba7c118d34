// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>

#include <sigwire/chain/client.hpp>
#include <sigwire/rpc/http/client.hpp>

namespace sigwire::chain {

//! \brief Client for an Ethereum node speaking JSON-RPC 2.0 over HTTP
class RemoteClient : public Client {
  public:
    explicit RemoteClient(std::unique_ptr<rpc::http::Client> http_client);

    Task<ChainId> chain_id() override;
    Task<uint64_t> get_transaction_count(const evmc::address& address, BlockTag tag) override;
    Task<Bytes> get_code(const evmc::address& address) override;
    Task<evmc::bytes32> send_raw_transaction(const Bytes& rlp) override;
    Task<std::optional<Receipt>> get_transaction_receipt(const evmc::bytes32& hash) override;
    Task<uint64_t> estimate_gas(const CallRequest& call) override;
    Task<intx::uint256> max_priority_fee_per_gas() override;
    Task<intx::uint256> base_fee_per_gas() override;

  private:
    //! Sends one request and returns its result member
    Task<nlohmann::json> call(std::string_view method, nlohmann::json params);

    std::unique_ptr<rpc::http::Client> http_client_;
    std::atomic_uint64_t next_id_{1};
};

}  // namespace sigwire::chain
