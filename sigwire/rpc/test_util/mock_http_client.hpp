// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <sigwire/rpc/http/client.hpp>

namespace sigwire::rpc::test_util {

class MockHttpClient : public http::Client {  // NOLINT
  public:
    MOCK_METHOD((Task<http::Response>), send, (http::Request), (override));
};

}  // namespace sigwire::rpc::test_util
