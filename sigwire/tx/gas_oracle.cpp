// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "gas_oracle.hpp"

#include <limits>
#include <string>

#include <sigwire/common/errors.hpp>
#include <sigwire/infra/common/log.hpp>

namespace sigwire::tx {

Task<uint64_t> GasOracle::estimate_gas_limit(const TransactionRequest& request) {
    const chain::CallRequest call{
        .from = request.from,
        .to = request.to,
        .value = request.value,
        .data = request.data,
    };
    uint64_t estimate{0};
    try {
        estimate = co_await chain_.estimate_gas(call);
    } catch (const chain::RpcError& e) {
        SIGW_WARN << "GasOracle: gas estimation failed from=" << request.from << " to=" << request.to
                  << " error=" << e.what();
        throw ChainRejectedError{std::string{"gas estimation failed: "} + e.what(), classify_rejection(e.what()),
                                 std::nullopt, ErrorContext{.account = request.from, .last_state = "NotSent"}};
    }
    const intx::uint256 gas_limit{intx::uint256{estimate} * gas_limit_margin_percent_ / 100};
    if (gas_limit > intx::uint256{std::numeric_limits<uint64_t>::max()}) {
        throw ChainRejectedError{"gas estimate " + std::to_string(estimate) + " with a margin of " +
                                     std::to_string(gas_limit_margin_percent_) + "% exceeds the gas limit range",
                                 ChainRejection::kOther, std::nullopt,
                                 ErrorContext{.account = request.from, .last_state = "NotSent"}};
    }
    co_return static_cast<uint64_t>(gas_limit);
}

Task<GasParameters> GasOracle::complete(const TransactionRequest& request) {
    GasParameters gas{request.gas};
    if (gas.is_complete(request.type)) {
        co_return gas;
    }

    if (!gas.gas_limit) {
        gas.gas_limit = co_await estimate_gas_limit(request);
    }
    if (!gas.max_fee_per_gas || (request.type == TransactionType::kDynamicFee && !gas.max_priority_fee_per_gas)) {
        intx::uint256 tip{0};
        if (gas.max_priority_fee_per_gas) {
            tip = *gas.max_priority_fee_per_gas;
        } else {
            tip = co_await chain_.max_priority_fee_per_gas();
        }
        if (request.type == TransactionType::kDynamicFee) {
            gas.max_priority_fee_per_gas = tip;
        }
        if (!gas.max_fee_per_gas) {
            const intx::uint256 base_fee{co_await chain_.base_fee_per_gas()};
            if (request.type == TransactionType::kLegacy) {
                gas.max_fee_per_gas = base_fee + tip;
            } else {
                gas.max_fee_per_gas = base_fee * 2 + tip;
            }
        }
    }

    SIGW_DEBUG << "GasOracle: completed from=" << request.from << " gas_limit=" << *gas.gas_limit
               << " max_fee_per_gas=" << intx::to_string(*gas.max_fee_per_gas) << " max_priority_fee_per_gas="
               << intx::to_string(gas.max_priority_fee_per_gas.value_or(0));
    co_return gas;
}

}  // namespace sigwire::tx
