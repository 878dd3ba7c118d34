// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <sigwire/core/common/base.hpp>

namespace sigwire {

//! \brief Inclusion proof of a transaction as reported by the chain
struct Receipt {
    evmc::bytes32 transaction_hash;
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    bool success{false};  // EIP-658 status
    uint64_t gas_used{0};
    std::optional<evmc::address> contract_address;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

}  // namespace sigwire
