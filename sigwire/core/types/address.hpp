// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <sigwire/core/common/bytes.hpp>

namespace sigwire {

// https://eips.ethereum.org/EIPS/eip-1014
evmc::address create2_address(const evmc::address& caller, const evmc::bytes32& salt,
                              const uint8_t (&code_hash)[32]) noexcept;

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a 0x-prefixed, 40 hex digits address.
//! Mixed-case input must carry a valid EIP-55 checksum, all-lowercase and all-uppercase input is accepted as is.
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

// https://eips.ethereum.org/EIPS/eip-55
std::string address_to_checksum_hex(const evmc::address& address);

namespace rlp {
    void encode(Bytes& to, const evmc::address& address);
    size_t length(const evmc::address& address) noexcept;
}  // namespace rlp

}  // namespace sigwire

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& bytes32);

}  // namespace evmc
