// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <sigwire/common/types.hpp>
#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire::signer {

//! \brief Signing capability used by the transaction path
class Signer {
  public:
    virtual ~Signer() = default;

    //! \brief Signs the request content, never retries
    //! \throws ValidationError if the sender has no signing key,
    //! SignerUnavailableError on transient failures, SignerRejectedError on terminal ones
    virtual Task<SignedTransaction> sign(const SigningRequest& request) = 0;

    //! \brief Returns the transaction signed for this exact content by a previous sign call whose response was lost
    virtual Task<std::optional<SignedTransaction>> recover(const SigningRequest& request) = 0;

    virtual Task<bool> available() = 0;
};

}  // namespace sigwire::signer
