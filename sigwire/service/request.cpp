// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <utility>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>

namespace sigwire {

static std::string invalid(std::string_view field, std::string_view input, std::string_view expected) {
    std::string message{"invalid "};
    message.append(field).append(" \"").append(abridge(input, 80)).append("\": expected ").append(expected);
    return message;
}

evmc::address parse_address(std::string_view field, std::string_view input) {
    const auto address{hex_to_address(input)};
    if (!address) {
        throw ValidationError{invalid(field, input, "0x-prefixed 20-byte hex address with valid checksum")};
    }
    return *address;
}

intx::uint256 parse_quantity(std::string_view field, std::string_view input) {
    const auto quantity{parse_uint256(input)};
    if (!quantity) {
        throw ValidationError{invalid(field, input, "non-negative decimal or 0x-prefixed hex integer below 2^256")};
    }
    return *quantity;
}

Bytes parse_data(std::string_view field, std::string_view input) {
    if (input.empty()) {
        return {};
    }
    auto data{from_hex(input)};
    if (!data) {
        throw ValidationError{invalid(field, input, "hex encoded bytes")};
    }
    return std::move(*data);
}

evmc::bytes32 parse_salt(std::string_view field, std::string_view input) {
    return intx::be::store<evmc::bytes32>(parse_quantity(field, input));
}

TransactionRequest make_transaction_request(const SendParameters& parameters) {
    TransactionRequest request{
        .from = parse_address("sender", parameters.from),
        .to = parse_address("recipient", parameters.to),
        .value = parse_quantity("value", parameters.value),
    };
    if (parameters.data) {
        request.data = parse_data("data", *parameters.data);
    }
    return request;
}

tba::AccountRequest make_account_request(const TbaParameters& parameters, const ServiceSettings& settings) {
    tba::AccountRequest request{
        .token_contract = parse_address("collection", parameters.collection),
        .token_id = parse_quantity("token id", parameters.token_id),
        .chain_id = settings.chain_id,
        .salt = settings.default_salt,
    };
    if (parameters.implementation) {
        request.implementation = parse_address("implementation", *parameters.implementation);
    } else if (settings.default_implementation) {
        request.implementation = *settings.default_implementation;
    } else {
        throw ValidationError{"no account implementation given and none configured"};
    }
    if (parameters.token_chain_id) {
        request.chain_id = parse_quantity("token chain id", *parameters.token_chain_id);
    }
    if (parameters.salt) {
        request.salt = parse_salt("salt", *parameters.salt);
    }
    return request;
}

evmc::address derive_tba(const TbaParameters& parameters, const ServiceSettings& settings) {
    const tba::AccountRequest request{make_account_request(parameters, settings)};
    return tba::derive_account_address(settings.registry, request.implementation, request.salt, request.chain_id,
                                       request.token_contract, request.token_id);
}

}  // namespace sigwire
