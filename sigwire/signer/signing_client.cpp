// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "signing_client.hpp"

#include <utility>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/crypto/ecdsa.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/log.hpp>

namespace sigwire::signer {

std::string idempotency_key(const evmc::bytes32& signing_hash) {
    return to_hex(ByteView{signing_hash.bytes}, /*with_prefix=*/true);
}

static ErrorContext context_of(const SigningRequest& request, std::string state) {
    return {.account = request.request.from, .nonce = request.nonce, .last_state = std::move(state)};
}

SigningClient::SigningClient(CustodyBackend& backend, CustodyAccounts accounts)
    : backend_{backend}, accounts_{std::move(accounts)} {}

const std::string& SigningClient::custody_account(const SigningRequest& request) const {
    const auto it{accounts_.find(request.request.from)};
    if (it == accounts_.end()) {
        throw ValidationError{"no custody account for sender " + address_to_checksum_hex(request.request.from),
                              context_of(request, "NotSent")};
    }
    return it->second;
}

Task<SignedTransaction> SigningClient::sign(const SigningRequest& request) {
    const std::string& account{custody_account(request)};
    const UnsignedTransaction txn{request.unsigned_transaction()};

    SignatureRequest signature_request;
    txn.encode_for_signing(signature_request.payload);
    signature_request.account = account;
    signature_request.digest = txn.signing_hash();
    signature_request.idempotency_key = idempotency_key(signature_request.digest);

    SIGW_DEBUG << "SigningClient::sign account=" << account << " nonce=" << request.nonce
               << " key=" << signature_request.idempotency_key;
    Bytes signature;
    try {
        signature = co_await backend_.request_signature(signature_request);
    } catch (const SignerUnavailableError& e) {
        throw SignerUnavailableError{e.what(), e.outcome_unknown(), context_of(request, "NotSent")};
    } catch (const SignerRejectedError& e) {
        throw SignerRejectedError{e.what(), context_of(request, "NotSent")};
    }
    co_return assemble(request, txn, signature);
}

Task<std::optional<SignedTransaction>> SigningClient::recover(const SigningRequest& request) {
    custody_account(request);
    const UnsignedTransaction txn{request.unsigned_transaction()};
    const auto key{idempotency_key(txn.signing_hash())};

    const auto signature = co_await backend_.find_signature(key);
    if (!signature) {
        SIGW_DEBUG << "SigningClient::recover no signature for key=" << key;
        co_return std::nullopt;
    }
    SIGW_DEBUG << "SigningClient::recover found signature for key=" << key;
    co_return assemble(request, txn, *signature);
}

Task<bool> SigningClient::available() {
    co_return co_await backend_.is_available();
}

SignedTransaction SigningClient::assemble(const SigningRequest& request, const UnsignedTransaction& txn, ByteView signature) {
    const auto parsed{ecdsa::parse_signature(signature)};
    if (!parsed) {
        throw SignerRejectedError{"malformed signature of " + std::to_string(signature.size()) + " bytes",
                                  context_of(request, "NotSent")};
    }

    SignedTransaction signed_txn;
    signed_txn.signing_hash = txn.signing_hash();
    const auto recovered{ecdsa::recover_address(signed_txn.signing_hash, *parsed)};
    if (recovered != request.request.from) {
        throw SignerRejectedError{"signature recovers to " + (recovered ? address_to_hex(*recovered) : "nothing") +
                                      " instead of the sender",
                                  context_of(request, "NotSent")};
    }

    signed_txn.transaction.UnsignedTransaction::operator=(txn);
    signed_txn.transaction.odd_y_parity = parsed->odd_y_parity;
    signed_txn.transaction.r = parsed->r;
    signed_txn.transaction.s = parsed->s;
    signed_txn.transaction.encode(signed_txn.raw);
    signed_txn.hash = signed_txn.transaction.hash();
    signed_txn.sender = request.request.from;
    return signed_txn;
}

}  // namespace sigwire::signer
