// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <sigwire/core/common/bytes.hpp>
#include <sigwire/core/types/receipt.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace sigwire {

void from_json(const nlohmann::json& json, Receipt& receipt);

}  // namespace sigwire

namespace sigwire::rpc {

//! \brief Parses a QUANTITY (0x-prefixed hex without leading zeros) into a 64-bit unsigned integer
//! \throws std::invalid_argument on malformed or out of range input
uint64_t from_quantity(std::string_view hex_quantity);

//! \brief Parses a QUANTITY into a 256-bit unsigned integer
//! \throws std::invalid_argument on malformed input
intx::uint256 uint256_from_quantity(std::string_view hex_quantity);

std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);
std::string to_quantity(ByteView bytes);

//! \brief 0x-prefixed DATA encoding, leading zeros are kept
std::string to_data(ByteView bytes);

//! \brief Decodes a 0x-prefixed DATA string
//! \throws std::invalid_argument on malformed input
Bytes from_data(std::string_view hex_data);

nlohmann::json make_json_request(uint64_t id, std::string_view method, nlohmann::json params = nlohmann::json::array());

}  // namespace sigwire::rpc
