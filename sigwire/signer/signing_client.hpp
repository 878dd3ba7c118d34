// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <string>

#include <evmc/evmc.hpp>

#include <sigwire/signer/custody_backend.hpp>
#include <sigwire/signer/signer.hpp>

namespace sigwire::signer {

//! Sender address to custody account identifier
using CustodyAccounts = std::map<evmc::address, std::string>;

//! \brief Signs transactions through a custody backend and verifies every returned signature
class SigningClient : public Signer {
  public:
    SigningClient(CustodyBackend& backend, CustodyAccounts accounts);

    Task<SignedTransaction> sign(const SigningRequest& request) override;
    Task<std::optional<SignedTransaction>> recover(const SigningRequest& request) override;
    Task<bool> available() override;

  private:
    const std::string& custody_account(const SigningRequest& request) const;

    //! Attaches the signature and checks it was produced by the sender key
    static SignedTransaction assemble(const SigningRequest& request, const UnsignedTransaction& txn, ByteView signature);

    CustodyBackend& backend_;
    CustodyAccounts accounts_;
};

//! \brief Idempotency key of a content: the hex signing hash
std::string idempotency_key(const evmc::bytes32& signing_hash);

}  // namespace sigwire::signer
