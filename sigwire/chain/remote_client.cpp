// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "remote_client.hpp"

#include <utility>

#include <sigwire/core/common/util.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/rpc/json/types.hpp>

#include <boost/system/errc.hpp>

namespace sigwire::chain {

std::string_view to_string(BlockTag tag) {
    switch (tag) {
        case BlockTag::kLatest:
            return "latest";
        case BlockTag::kPending:
            return "pending";
    }
    return "latest";
}

RemoteClient::RemoteClient(std::unique_ptr<rpc::http::Client> http_client)
    : http_client_{std::move(http_client)} {}

Task<nlohmann::json> RemoteClient::call(std::string_view method, nlohmann::json params) {
    const auto id{next_id_++};
    const auto request{rpc::make_json_request(id, method, std::move(params))};
    SIGW_TRACE << "RemoteClient::call request: " << request.dump();

    const auto response = co_await http_client_->send({
        .method = boost::beast::http::verb::post,
        .target = "",
        .headers = {},
        .body = request.dump(),
    });

    const auto reply = nlohmann::json::parse(response.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.is_object()) {
        SIGW_DEBUG << "RemoteClient::call " << method << " unexpected reply status=" << response.status;
        // The node may still have processed the request
        throw rpc::http::TransportError{make_error_code(boost::system::errc::bad_message), /*request_sent=*/true};
    }
    if (const auto error = reply.find("error"); error != reply.end() && !error->is_null()) {
        const int code{error->value("code", 0)};
        const std::string message{error->value("message", std::string{})};
        SIGW_DEBUG << "RemoteClient::call " << method << " error code=" << code << " message=" << message;
        throw RpcError{code, message};
    }
    if (!reply.contains("result")) {
        throw RpcError{-32603, "missing result in reply to " + std::string{method}};
    }
    co_return reply.at("result");
}

Task<ChainId> RemoteClient::chain_id() {
    const auto result = co_await call("eth_chainId", nlohmann::json::array());
    co_return rpc::from_quantity(result.get<std::string>());
}

Task<uint64_t> RemoteClient::get_transaction_count(const evmc::address& address, BlockTag tag) {
    const auto result = co_await call("eth_getTransactionCount", {address, std::string{to_string(tag)}});
    co_return rpc::from_quantity(result.get<std::string>());
}

Task<Bytes> RemoteClient::get_code(const evmc::address& address) {
    const auto result = co_await call("eth_getCode", {address, "latest"});
    co_return rpc::from_data(result.get<std::string>());
}

Task<evmc::bytes32> RemoteClient::send_raw_transaction(const Bytes& rlp) {
    const auto result = co_await call("eth_sendRawTransaction", {rpc::to_data(rlp)});
    co_return result.get<evmc::bytes32>();
}

Task<std::optional<Receipt>> RemoteClient::get_transaction_receipt(const evmc::bytes32& hash) {
    const auto result = co_await call("eth_getTransactionReceipt", {hash});
    if (result.is_null()) {
        co_return std::nullopt;
    }
    co_return result.get<Receipt>();
}

Task<uint64_t> RemoteClient::estimate_gas(const CallRequest& call_request) {
    nlohmann::json call_json = nlohmann::json::object();
    if (call_request.from) {
        call_json["from"] = *call_request.from;
    }
    if (call_request.to) {
        call_json["to"] = *call_request.to;
    }
    call_json["value"] = rpc::to_quantity(call_request.value);
    if (!call_request.data.empty()) {
        call_json["input"] = rpc::to_data(call_request.data);
    }
    const auto result = co_await call("eth_estimateGas", nlohmann::json::array({call_json}));
    co_return rpc::from_quantity(result.get<std::string>());
}

Task<intx::uint256> RemoteClient::max_priority_fee_per_gas() {
    const auto result = co_await call("eth_maxPriorityFeePerGas", nlohmann::json::array());
    co_return rpc::uint256_from_quantity(result.get<std::string>());
}

Task<intx::uint256> RemoteClient::base_fee_per_gas() {
    const auto result = co_await call("eth_getBlockByNumber", {"latest", false});
    if (result.is_null() || !result.contains("baseFeePerGas")) {
        throw RpcError{-32603, "latest block carries no base fee"};
    }
    co_return rpc::uint256_from_quantity(result.at("baseFeePerGas").get<std::string>());
}

}  // namespace sigwire::chain
