// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <evmc/evmc.hpp>

namespace sigwire {

//! \brief What the caller needs to decide on a manual resubmission
struct ErrorContext {
    std::optional<evmc::address> account;
    std::optional<uint64_t> nonce;
    std::string last_state;
};

std::ostream& operator<<(std::ostream& out, const ErrorContext& context);

//! \brief Root of all errors surfaced by the transaction and provisioning paths
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message, ErrorContext context = {});

    const ErrorContext& context() const { return context_; }

    //! Message without the context suffix
    const std::string& message() const { return message_; }

  private:
    std::string message_;
    ErrorContext context_;
};

//! \brief Malformed input, never retried
class ValidationError : public Error {
  public:
    using Error::Error;
};

class SignerError : public Error {
  public:
    using Error::Error;
};

//! \brief Transient signer failure, retryable
class SignerUnavailableError : public SignerError {
  public:
    explicit SignerUnavailableError(const std::string& message, bool outcome_unknown = false, ErrorContext context = {})
        : SignerError{message, std::move(context)}, outcome_unknown_{outcome_unknown} {}

    //! Whether the backend may have produced the signature even though no response was received
    bool outcome_unknown() const { return outcome_unknown_; }

  private:
    bool outcome_unknown_;
};

//! \brief Terminal signer failure (policy denial, malformed request, wrong key)
class SignerRejectedError : public SignerError {
  public:
    using SignerError::SignerError;
};

//! \brief Submission outcome is ambiguous, reconciliation against the chain is required before any retry
class BroadcastTimeoutError : public Error {
  public:
    using Error::Error;
};

enum class ChainRejection {
    kNonceTooLow,
    kInsufficientFunds,
    kUnderpriced,
    kAlreadyKnown,
    kReverted,
    kOther,
};

//! \brief Maps a node error message to its rejection reason
ChainRejection classify_rejection(std::string_view message);

//! \brief Transaction invalid per chain rules, terminal
class ChainRejectedError : public Error {
  public:
    ChainRejectedError(const std::string& message, ChainRejection reason,
                       std::optional<evmc::bytes32> transaction_hash = std::nullopt, ErrorContext context = {})
        : Error{message, std::move(context)}, reason_{reason}, transaction_hash_{transaction_hash} {}

    ChainRejection reason() const { return reason_; }
    const std::optional<evmc::bytes32>& transaction_hash() const { return transaction_hash_; }

  private:
    ChainRejection reason_;
    std::optional<evmc::bytes32> transaction_hash_;
};

//! \brief Retry budget exceeded, the nonce state is left consistent for a manual retry
class SubmissionExhaustedError : public Error {
  public:
    using Error::Error;
};

//! \brief A not yet deployed token bound account could not be provisioned
class DeploymentFailedError : public Error {
  public:
    DeploymentFailedError(const std::string& message, const evmc::address& account_address, ErrorContext context = {})
        : Error{message, std::move(context)}, account_address_{account_address} {}

    const evmc::address& account_address() const { return account_address_; }

  private:
    evmc::address account_address_;
};

}  // namespace sigwire
