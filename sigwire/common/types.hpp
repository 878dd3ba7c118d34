// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/core/common/base.hpp>
#include <sigwire/core/common/bytes.hpp>
#include <sigwire/core/types/receipt.hpp>
#include <sigwire/core/types/transaction.hpp>

namespace sigwire {

//! \brief Fee and gas settings of a transaction, missing values are completed from chain state before signing
struct GasParameters {
    std::optional<uint64_t> gas_limit;
    std::optional<intx::uint256> max_fee_per_gas;  // gas price for legacy transactions
    std::optional<intx::uint256> max_priority_fee_per_gas;

    bool is_complete(TransactionType type) const {
        return gas_limit && max_fee_per_gas && (type == TransactionType::kLegacy || max_priority_fee_per_gas);
    }

    friend bool operator==(const GasParameters&, const GasParameters&) = default;
};

struct TransactionRequest {
    evmc::address from;
    evmc::address to;
    intx::uint256 value{0};
    Bytes data;
    GasParameters gas;
    TransactionType type{TransactionType::kDynamicFee};

    friend bool operator==(const TransactionRequest&, const TransactionRequest&) = default;
};

//! \brief A request ready to be signed: nonce assigned and gas parameters complete
struct SigningRequest {
    TransactionRequest request;
    uint64_t nonce{0};
    ChainId chain_id{0};

    //! \throws std::invalid_argument if gas parameters are incomplete
    UnsignedTransaction unsigned_transaction() const;
};

struct SignedTransaction {
    Transaction transaction;
    evmc::address sender;
    evmc::bytes32 signing_hash;  // content identity, shared by every signing of the same content
    evmc::bytes32 hash;          // on-chain identifier, keccak256 of raw
    Bytes raw;                   // submittable encoding

    uint64_t nonce() const { return transaction.nonce; }
};

enum class TransactionStatus {
    kPending,
    kConfirmed,
    kFailed,
    kDropped,
};

struct TransactionOutcome {
    TransactionStatus status{TransactionStatus::kPending};
    std::optional<Receipt> receipt;
    std::string reason;  // set for kFailed and kDropped
    uint64_t nonce{0};
    evmc::bytes32 hash;

    bool is_terminal() const { return status != TransactionStatus::kPending; }
};

std::string_view to_string(TransactionStatus status);

std::ostream& operator<<(std::ostream& out, const TransactionOutcome& outcome);

}  // namespace sigwire
