// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <bit>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/crypto/ecdsa.hpp>
#include <sigwire/core/rlp/decode.hpp>
#include <sigwire/core/rlp/encode.hpp>
#include <sigwire/core/types/address.hpp>

namespace sigwire {

namespace rlp {

    static Header header_base(const UnsignedTransaction& txn) {
        Header h{.list = true};

        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.chain_id.value_or(0));
        }

        h.payload_length += length(txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            h.payload_length += length(txn.max_priority_fee_per_gas);
        }
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += txn.to ? (kAddressLength + 1) : 1;
        h.payload_length += length(txn.value);
        h.payload_length += length(ByteView{txn.data});

        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += 1;  // empty access list
        }

        return h;
    }

    static Header header_for_signing(const UnsignedTransaction& txn) {
        Header h{header_base(txn)};
        if (txn.type == TransactionType::kLegacy && txn.chain_id) {
            h.payload_length += length(*txn.chain_id) + 2;
        }
        return h;
    }

    static Header header(const Transaction& txn) {
        Header h{header_base(txn)};

        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.odd_y_parity);
        } else {
            h.payload_length += length(txn.v());
        }
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);

        return h;
    }

    static void encode_base(Bytes& to, const UnsignedTransaction& txn) {
        if (txn.type != TransactionType::kLegacy) {
            encode(to, txn.chain_id.value_or(0));
        }
        encode(to, txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            encode(to, txn.max_priority_fee_per_gas);
        }
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        if (txn.to) {
            encode(to, *txn.to);
        } else {
            to.push_back(kEmptyStringCode);
        }
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
        if (txn.type != TransactionType::kLegacy) {
            to.push_back(kEmptyListCode);
        }
    }

    static DecodingResult decode_to(ByteView& from, std::optional<evmc::address>& to) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        if (from[0] == kEmptyStringCode) {
            to = std::nullopt;
            from.remove_prefix(1);
            return {};
        }
        to = evmc::address{};
        return decode(from, to->bytes, Leftover::kAllow);
    }

    static DecodingResult legacy_decode_items(ByteView& from, Transaction& to) noexcept {
        if (DecodingResult res{decode_items(from, to.nonce, to.max_fee_per_gas, to.gas_limit)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }

        intx::uint256 v;
        if (DecodingResult res{decode_items(from, to.value, to.data, v)}; !res) {
            return res;
        }
        if (!to.set_v(v)) {
            return tl::unexpected{DecodingError::kInvalidVInSignature};
        }

        return decode_items(from, to.r, to.s);
    }

    static DecodingResult dynamic_fee_decode_items(ByteView& from, Transaction& to) noexcept {
        intx::uint256 chain_id;
        if (DecodingResult res{decode_items(from, chain_id, to.nonce, to.max_priority_fee_per_gas,
                                            to.max_fee_per_gas, to.gas_limit)};
            !res) {
            return res;
        }
        to.chain_id = chain_id;

        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(from, to.value, to.data)}; !res) {
            return res;
        }

        // Only empty access lists are ever produced
        const auto access_list{decode_header(from)};
        if (!access_list) {
            return tl::unexpected{access_list.error()};
        }
        if (!access_list->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        from.remove_prefix(access_list->payload_length);

        return decode_items(from, to.odd_y_parity, to.r, to.s);
    }

    DecodingResult decode_transaction(ByteView& from, Transaction& to) noexcept {
        to = Transaction{};

        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }

        if (from[0] >= kEmptyListCode) {
            to.type = TransactionType::kLegacy;
        } else if (from[0] == static_cast<uint8_t>(TransactionType::kDynamicFee)) {
            to.type = TransactionType::kDynamicFee;
            from.remove_prefix(1);
        } else {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }

        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }

        ByteView payload{from.substr(0, h->payload_length)};
        const DecodingResult res{to.type == TransactionType::kLegacy ? legacy_decode_items(payload, to)
                                                                    : dynamic_fee_decode_items(payload, to)};
        if (!res) {
            return res;
        }
        if (!payload.empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }

        from.remove_prefix(h->payload_length);
        if (!from.empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

}  // namespace rlp

void UnsignedTransaction::encode_for_signing(Bytes& into) const {
    if (type != TransactionType::kLegacy) {
        into.push_back(static_cast<uint8_t>(type));
    }
    rlp::encode_header(into, rlp::header_for_signing(*this));
    rlp::encode_base(into, *this);
    if (type == TransactionType::kLegacy && chain_id) {
        rlp::encode(into, *chain_id);
        rlp::encode(into, uint64_t{0});
        rlp::encode(into, uint64_t{0});
    }
}

evmc::bytes32 UnsignedTransaction::signing_hash() const {
    Bytes rlp;
    encode_for_signing(rlp);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

// https://eips.ethereum.org/EIPS/eip-155
intx::uint256 Transaction::v() const {
    if (chain_id.has_value()) {
        return *chain_id * 2 + 35 + (odd_y_parity ? 1 : 0);
    }
    return odd_y_parity ? 28 : 27;
}

bool Transaction::set_v(const intx::uint256& v) {
    if (v == 27 || v == 28) {
        odd_y_parity = v == 28;
        chain_id = std::nullopt;
    } else if (v >= 35) {
        odd_y_parity = ((v - 35) % 2) == 1;
        chain_id = (v - 35) >> 1;
    } else {
        return false;
    }
    return true;
}

std::optional<evmc::address> Transaction::recover_sender() const {
    return ecdsa::recover_address(signing_hash(), ecdsa::Signature{.r = r, .s = s, .odd_y_parity = odd_y_parity});
}

void Transaction::encode(Bytes& into) const {
    if (type != TransactionType::kLegacy) {
        into.push_back(static_cast<uint8_t>(type));
    }
    rlp::encode_header(into, rlp::header(*this));
    rlp::encode_base(into, *this);
    if (type != TransactionType::kLegacy) {
        rlp::encode(into, odd_y_parity);
    } else {
        rlp::encode(into, v());
    }
    rlp::encode(into, r);
    rlp::encode(into, s);
}

evmc::bytes32 Transaction::hash() const {
    Bytes rlp;
    encode(rlp);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

}  // namespace sigwire
