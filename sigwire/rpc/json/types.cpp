// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

#include <sigwire/core/common/endian.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/log.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = sigwire::address_to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto parsed{sigwire::hex_to_address(json.get<std::string>())};
    if (!parsed) {
        throw std::invalid_argument{"invalid address: " + json.dump()};
    }
    addr = *parsed;
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = sigwire::to_hex(sigwire::ByteView{b32.bytes}, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto hex{json.get<std::string>()};
    if (!sigwire::is_valid_hash(hex)) {
        throw std::invalid_argument{"invalid hash: " + hex};
    }
    const auto bytes{sigwire::from_hex(hex)};
    std::memcpy(b32.bytes, bytes->data(), sigwire::kHashLength);
}

}  // namespace evmc

namespace sigwire {

void from_json(const nlohmann::json& json, Receipt& receipt) {
    SIGW_TRACE << "from_json<Receipt> json: " << json.dump();
    receipt.transaction_hash = json.at("transactionHash").get<evmc::bytes32>();
    receipt.block_hash = json.at("blockHash").get<evmc::bytes32>();
    receipt.block_num = rpc::from_quantity(json.at("blockNumber").get<std::string>());
    receipt.gas_used = rpc::from_quantity(json.at("gasUsed").get<std::string>());
    receipt.success = rpc::from_quantity(json.at("status").get<std::string>()) == 1;
    const auto contract_address{json.find("contractAddress")};
    if (contract_address != json.end() && !contract_address->is_null()) {
        receipt.contract_address = contract_address->get<evmc::address>();
    } else {
        receipt.contract_address.reset();
    }
}

}  // namespace sigwire

namespace sigwire::rpc {

uint64_t from_quantity(std::string_view hex_quantity) {
    const intx::uint256 value{uint256_from_quantity(hex_quantity)};
    if (value > std::numeric_limits<uint64_t>::max()) {
        throw std::invalid_argument{"quantity out of range: " + std::string{hex_quantity}};
    }
    return static_cast<uint64_t>(value);
}

intx::uint256 uint256_from_quantity(std::string_view hex_quantity) {
    if (!is_valid_hex(hex_quantity) || hex_quantity.size() > 2 + 64) {
        throw std::invalid_argument{"invalid quantity: " + std::string{hex_quantity}};
    }
    const auto value{parse_uint256(hex_quantity)};
    if (!value) {
        throw std::invalid_argument{"invalid quantity: " + std::string{hex_quantity}};
    }
    return *value;
}

std::string to_quantity(ByteView bytes) {
    std::string hexed{to_hex(zeroless_view(bytes))};
    if (hexed.empty()) {
        return "0x0";
    }
    if (hexed.front() == '0') {
        hexed.erase(0, 1);
    }
    return "0x" + hexed;
}

std::string to_quantity(uint64_t number) {
    return to_quantity(endian::to_big_compact(number));
}

std::string to_quantity(const intx::uint256& number) {
    return to_quantity(endian::to_big_compact(number));
}

std::string to_data(ByteView bytes) {
    return to_hex(bytes, /*with_prefix=*/true);
}

Bytes from_data(std::string_view hex_data) {
    if (hex_data == "0x") {
        return {};
    }
    if (!is_valid_hex(hex_data) || hex_data.size() % 2 != 0) {
        throw std::invalid_argument{"invalid data: " + std::string{hex_data}};
    }
    return *from_hex(hex_data);
}

nlohmann::json make_json_request(uint64_t id, std::string_view method, nlohmann::json params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", std::string{method}},
        {"params", std::move(params)},
    };
}

}  // namespace sigwire::rpc
