// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gmock/gmock.h>

#include <sigwire/chain/client.hpp>

namespace sigwire::test_util {

class MockChainClient : public chain::Client {  // NOLINT
  public:
    MOCK_METHOD((Task<ChainId>), chain_id, (), (override));
    MOCK_METHOD((Task<uint64_t>), get_transaction_count, (const evmc::address&, chain::BlockTag), (override));
    MOCK_METHOD((Task<Bytes>), get_code, (const evmc::address&), (override));
    MOCK_METHOD((Task<evmc::bytes32>), send_raw_transaction, (const Bytes&), (override));
    MOCK_METHOD((Task<std::optional<Receipt>>), get_transaction_receipt, (const evmc::bytes32&), (override));
    MOCK_METHOD((Task<uint64_t>), estimate_gas, (const chain::CallRequest&), (override));
    MOCK_METHOD((Task<intx::uint256>), max_priority_fee_per_gas, (), (override));
    MOCK_METHOD((Task<intx::uint256>), base_fee_per_gas, (), (override));
};

}  // namespace sigwire::test_util
