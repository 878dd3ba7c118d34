// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gmock/gmock.h>

#include <sigwire/signer/signer.hpp>

namespace sigwire::test_util {

class MockSigner : public signer::Signer {  // NOLINT
  public:
    MOCK_METHOD((Task<SignedTransaction>), sign, (const SigningRequest&), (override));
    MOCK_METHOD((Task<std::optional<SignedTransaction>>), recover, (const SigningRequest&), (override));
    MOCK_METHOD((Task<bool>), available, (), (override));
};

}  // namespace sigwire::test_util
