// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <stdexcept>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/crypto/secp256k1_context.hpp>
#include <sigwire/core/types/address.hpp>

namespace sigwire::ecdsa {

static evmc::address public_key_to_address(ByteView uncompressed) {
    // Skip the 0x04 prefix of uncompressed points
    const auto hash{keccak256(uncompressed.substr(1))};
    return bytes_to_address(ByteView{hash.bytes}.substr(12));
}

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept {
    if (r == 0 || s == 0) {
        return false;
    }
    if (r >= kSecp256k1n || s >= kSecp256k1n) {
        return false;
    }
    // https://eips.ethereum.org/EIPS/eip-2
    return s <= kSecp256k1Halfn;
}

std::optional<Signature> parse_signature(ByteView data) noexcept {
    if (data.size() != kSignatureLength) {
        return std::nullopt;
    }
    uint8_t v{data[64]};
    if (v == 27 || v == 28) {
        v -= 27;
    }
    if (v > 1) {
        return std::nullopt;
    }
    Signature signature;
    signature.r = intx::be::unsafe::load<intx::uint256>(&data[0]);
    signature.s = intx::be::unsafe::load<intx::uint256>(&data[32]);
    signature.odd_y_parity = v == 1;
    return signature;
}

Bytes serialize_signature(const Signature& signature) {
    Bytes out(kSignatureLength, 0);
    intx::be::unsafe::store(&out[0], signature.r);
    intx::be::unsafe::store(&out[32], signature.s);
    out[64] = signature.odd_y_parity ? 1 : 0;
    return out;
}

std::optional<evmc::address> recover_address(const evmc::bytes32& digest, const Signature& signature) {
    if (!is_valid_signature(signature.r, signature.s)) {
        return std::nullopt;
    }
    Bytes compact(64, 0);
    intx::be::unsafe::store(&compact[0], signature.r);
    intx::be::unsafe::store(&compact[32], signature.s);

    SecP256K1Context ctx;
    secp256k1_ecdsa_recoverable_signature sig;
    if (!ctx.parse_recoverable_signature(&sig, compact, signature.odd_y_parity ? 1 : 0)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!ctx.recover_signature_public_key(&public_key, &sig, ByteView{digest.bytes})) {
        return std::nullopt;
    }
    return public_key_to_address(ctx.serialize_public_key(&public_key, /* is_compressed = */ false));
}

Signature sign(const evmc::bytes32& digest, ByteView private_key) {
    SecP256K1Context ctx{/* allow_verify = */ false, /* allow_sign = */ true};
    if (!ctx.verify_private_key_data(private_key)) {
        throw std::invalid_argument("ecdsa::sign invalid private key");
    }
    secp256k1_ecdsa_recoverable_signature sig;
    if (!ctx.sign_recoverable(&sig, ByteView{digest.bytes}, private_key)) {
        throw std::runtime_error("ecdsa::sign failed to sign digest");
    }
    const auto [data, recovery_id] = ctx.serialize_recoverable_signature(&sig);

    Signature signature;
    signature.r = intx::be::unsafe::load<intx::uint256>(&data[0]);
    signature.s = intx::be::unsafe::load<intx::uint256>(&data[32]);
    signature.odd_y_parity = recovery_id == 1;
    return signature;
}

evmc::address private_key_to_address(ByteView private_key) {
    SecP256K1Context ctx{/* allow_verify = */ false, /* allow_sign = */ true};
    if (!ctx.verify_private_key_data(private_key)) {
        throw std::invalid_argument("ecdsa::private_key_to_address invalid private key");
    }
    secp256k1_pubkey public_key;
    if (!ctx.create_public_key(&public_key, private_key)) {
        throw std::runtime_error("ecdsa::private_key_to_address failed to create a corresponding public key");
    }
    return public_key_to_address(ctx.serialize_public_key(&public_key, /* is_compressed = */ false));
}

}  // namespace sigwire::ecdsa
