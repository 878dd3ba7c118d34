// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Token bound accounts
// https://eips.ethereum.org/EIPS/eip-6551

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/core/common/bytes.hpp>

namespace sigwire::tba {

using namespace evmc::literals;

//! Canonical ERC-6551 registry, deployed at the same address on every chain
inline constexpr auto kDefaultRegistry{0x000000006551c19487814612e58FE06813775758_address};

inline constexpr evmc::bytes32 kDefaultSalt{};

//! Size of the ERC-1167 proxy with the appended immutable account data
inline constexpr size_t kAccountInitCodeLength{0xb7};

//! \brief Bytecode the registry deploys through CREATE2 for a token bound account
Bytes account_init_code(const evmc::address& implementation, const evmc::bytes32& salt,
                        const intx::uint256& chain_id, const evmc::address& token_contract,
                        const intx::uint256& token_id);

//! \brief Computes the account address exactly as ERC6551Registry.account does
evmc::address derive_account_address(const evmc::address& registry, const evmc::address& implementation,
                                     const evmc::bytes32& salt, const intx::uint256& chain_id,
                                     const evmc::address& token_contract, const intx::uint256& token_id);

//! \brief ABI encoded call to createAccount(address,bytes32,uint256,address,uint256)
Bytes create_account_calldata(const evmc::address& implementation, const evmc::bytes32& salt,
                              const intx::uint256& chain_id, const evmc::address& token_contract,
                              const intx::uint256& token_id);

//! \brief ABI encoded call to account(address,bytes32,uint256,address,uint256), the registry view
Bytes account_calldata(const evmc::address& implementation, const evmc::bytes32& salt,
                       const intx::uint256& chain_id, const evmc::address& token_contract,
                       const intx::uint256& token_id);

}  // namespace sigwire::tba
