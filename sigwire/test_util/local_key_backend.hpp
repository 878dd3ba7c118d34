// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>

#include <sigwire/common/errors.hpp>
#include <sigwire/common/types.hpp>
#include <sigwire/signer/custody_backend.hpp>

namespace sigwire::test_util {

//! \brief Custody backend holding plain private keys in memory, with scriptable failures
class LocalKeyBackend : public signer::CustodyBackend {
  public:
    enum class Failure {
        kUnavailable,    // refused, nothing signed
        kResponseLost,   // signed and recorded, but the caller gets a timeout
        kRejected,       // policy denial
    };

    //! Registers a key under a custody account id and returns the address it controls
    evmc::address add_key(const std::string& account, uint8_t private_key_last_byte);

    //! Next request_signature calls fail in the given order before normal operation resumes
    void fail_next(Failure failure) { failures_.push_back(failure); }

    //! Signs with another key than the requested one
    void sign_with_wrong_key(bool enabled) { wrong_key_ = enabled; }

    void set_available(bool available) { available_ = available; }

    Task<Bytes> request_signature(const signer::SignatureRequest& request) override;
    Task<std::optional<Bytes>> find_signature(const std::string& idempotency_key) override;
    Task<bool> is_available() override;

    //! Number of signatures actually produced
    size_t signatures_produced() const { return signatures_produced_; }
    size_t requests_received() const { return requests_received_; }

  private:
    std::map<std::string, Bytes> keys_;
    std::map<std::string, Bytes> signatures_;  // by idempotency key
    std::deque<Failure> failures_;
    bool wrong_key_{false};
    bool available_{true};
    size_t signatures_produced_{0};
    size_t requests_received_{0};
};

//! Signs the request content directly with the key ending in the given byte, bypassing any custody flow
SignedTransaction sign_with_key(const SigningRequest& request, uint8_t private_key_last_byte);

}  // namespace sigwire::test_util
