// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <magic_enum.hpp>

#include <sigwire/core/common/util.hpp>
#include <sigwire/infra/common/ensure.hpp>

namespace sigwire {

UnsignedTransaction SigningRequest::unsigned_transaction() const {
    ensure_pre_condition(request.gas.is_complete(request.type), [&]() {
        return "gas parameters incomplete for nonce " + std::to_string(nonce);
    });

    UnsignedTransaction txn;
    txn.type = request.type;
    txn.chain_id = chain_id;
    txn.nonce = nonce;
    txn.max_fee_per_gas = *request.gas.max_fee_per_gas;
    if (request.type == TransactionType::kDynamicFee) {
        txn.max_priority_fee_per_gas = *request.gas.max_priority_fee_per_gas;
    }
    txn.gas_limit = *request.gas.gas_limit;
    txn.to = request.to;
    txn.value = request.value;
    txn.data = request.data;
    return txn;
}

std::string_view to_string(TransactionStatus status) {
    // Strip the k prefix
    return magic_enum::enum_name(status).substr(1);
}

std::ostream& operator<<(std::ostream& out, const TransactionOutcome& outcome) {
    out << to_string(outcome.status) << " nonce=" << outcome.nonce
        << " hash=" << to_hex(ByteView{outcome.hash.bytes}, true);
    if (outcome.receipt) {
        out << " block=" << outcome.receipt->block_num;
    }
    if (!outcome.reason.empty()) {
        out << " reason=" << outcome.reason;
    }
    return out;
}

}  // namespace sigwire
