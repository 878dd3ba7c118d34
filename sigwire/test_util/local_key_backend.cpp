// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "local_key_backend.hpp"

#include <sigwire/core/crypto/ecdsa.hpp>

namespace sigwire::test_util {

static Bytes make_private_key(uint8_t last_byte) {
    Bytes key(32, 0);
    key[31] = last_byte;
    return key;
}

evmc::address LocalKeyBackend::add_key(const std::string& account, uint8_t private_key_last_byte) {
    keys_[account] = make_private_key(private_key_last_byte);
    return ecdsa::private_key_to_address(keys_[account]);
}

Task<Bytes> LocalKeyBackend::request_signature(const signer::SignatureRequest& request) {
    ++requests_received_;
    std::optional<Failure> failure;
    if (!failures_.empty()) {
        failure = failures_.front();
        failures_.pop_front();
    }
    if (failure == Failure::kUnavailable) {
        throw SignerUnavailableError{"custody backend overloaded"};
    }
    if (failure == Failure::kRejected) {
        throw SignerRejectedError{"policy denied"};
    }

    const auto key{keys_.find(request.account)};
    if (key == keys_.end()) {
        throw SignerRejectedError{"unknown account " + request.account};
    }

    Bytes signature;
    if (const auto previous{signatures_.find(request.idempotency_key)}; previous != signatures_.end()) {
        signature = previous->second;
    } else {
        const Bytes private_key{wrong_key_ ? make_private_key(0x7f) : key->second};
        signature = ecdsa::serialize_signature(ecdsa::sign(request.digest, private_key));
        if (!wrong_key_) {
            signatures_[request.idempotency_key] = signature;
        }
        ++signatures_produced_;
    }

    if (failure == Failure::kResponseLost) {
        throw SignerUnavailableError{"custody backend timed out", /*outcome_unknown=*/true};
    }
    co_return signature;
}

Task<std::optional<Bytes>> LocalKeyBackend::find_signature(const std::string& idempotency_key) {
    const auto it{signatures_.find(idempotency_key)};
    if (it == signatures_.end()) {
        co_return std::nullopt;
    }
    co_return it->second;
}

Task<bool> LocalKeyBackend::is_available() {
    co_return available_;
}

SignedTransaction sign_with_key(const SigningRequest& request, uint8_t private_key_last_byte) {
    const Bytes private_key{make_private_key(private_key_last_byte)};
    const UnsignedTransaction txn{request.unsigned_transaction()};

    SignedTransaction signed_txn;
    signed_txn.signing_hash = txn.signing_hash();
    const ecdsa::Signature signature{ecdsa::sign(signed_txn.signing_hash, private_key)};
    signed_txn.transaction.UnsignedTransaction::operator=(txn);
    signed_txn.transaction.odd_y_parity = signature.odd_y_parity;
    signed_txn.transaction.r = signature.r;
    signed_txn.transaction.s = signature.s;
    signed_txn.transaction.encode(signed_txn.raw);
    signed_txn.hash = signed_txn.transaction.hash();
    signed_txn.sender = ecdsa::private_key_to_address(private_key);
    return signed_txn;
}

}  // namespace sigwire::test_util
