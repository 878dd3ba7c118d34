// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/common/types.hpp>
#include <sigwire/service/settings.hpp>
#include <sigwire/tba/provisioner.hpp>

namespace sigwire {

//! \brief sendTransaction arguments as received from the caller
struct SendParameters {
    std::string from;
    std::string to;
    std::string value{"0"};
    std::optional<std::string> data;
};

//! \brief createTBA arguments as received from the caller, unset fields take the configured defaults
struct TbaParameters {
    std::string collection;
    std::string token_id;
    std::optional<std::string> implementation;
    std::optional<std::string> token_chain_id;
    std::optional<std::string> salt;
};

//! Parsers below throw ValidationError naming the offending field
evmc::address parse_address(std::string_view field, std::string_view input);
intx::uint256 parse_quantity(std::string_view field, std::string_view input);
Bytes parse_data(std::string_view field, std::string_view input);
evmc::bytes32 parse_salt(std::string_view field, std::string_view input);

TransactionRequest make_transaction_request(const SendParameters& parameters);

tba::AccountRequest make_account_request(const TbaParameters& parameters, const ServiceSettings& settings);

//! \brief Account address for the parameters, computed offline
evmc::address derive_tba(const TbaParameters& parameters, const ServiceSettings& settings);

}  // namespace sigwire
