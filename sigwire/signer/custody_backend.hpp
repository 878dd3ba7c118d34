// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmc/evmc.hpp>

#include <sigwire/core/common/bytes.hpp>
#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire::signer {

struct SignatureRequest {
    std::string account;          // custody-side identifier of the signing key
    Bytes payload;                // unsigned transaction encoding
    evmc::bytes32 digest;         // keccak256 of payload
    std::string idempotency_key;  // same key for the same content, lets the backend return a previous signature
};

//! \brief Remote signer holding the keys, e.g. an MPC custody service
class CustodyBackend {
  public:
    virtual ~CustodyBackend() = default;

    //! \brief Returns the 65 bytes r || s || v signature of request.digest
    //! \throws SignerUnavailableError on transient failures, SignerRejectedError on terminal ones
    virtual Task<Bytes> request_signature(const SignatureRequest& request) = 0;

    //! \brief Looks up a signature previously produced for the given idempotency key
    //! \throws SignerUnavailableError when the backend cannot be queried
    virtual Task<std::optional<Bytes>> find_signature(const std::string& idempotency_key) = 0;

    virtual Task<bool> is_available() = 0;
};

}  // namespace sigwire::signer
