// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/core/common/bytes.hpp>

namespace sigwire::ecdsa {

inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

//! \brief Compact signature as produced by custody backends: r || s || recovery id
inline constexpr size_t kSignatureLength{65};

struct Signature {
    intx::uint256 r{0};
    intx::uint256 s{0};
    bool odd_y_parity{false};

    friend bool operator==(const Signature&, const Signature&) = default;
};

//! \brief Verifies r and s are in range and s is in the lower half order (EIP-2)
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept;

//! \brief Parses a 65 bytes r || s || v signature.
//! v is accepted either as recovery id (0, 1) or in its legacy form (27, 28).
std::optional<Signature> parse_signature(ByteView data) noexcept;

//! \brief Serializes a signature into its 65 bytes r || s || recovery id form
Bytes serialize_signature(const Signature& signature);

//! \brief Tries recover the address of the key that signed the digest
std::optional<evmc::address> recover_address(const evmc::bytes32& digest, const Signature& signature);

//! \brief Signs a 32 bytes digest with deterministic RFC6979 nonce
//! \throws std::invalid_argument when the private key is not a valid secp256k1 scalar
Signature sign(const evmc::bytes32& digest, ByteView private_key);

//! \brief Derives the account address controlled by the private key
//! \throws std::invalid_argument when the private key is not a valid secp256k1 scalar
evmc::address private_key_to_address(ByteView private_key);

}  // namespace sigwire::ecdsa
