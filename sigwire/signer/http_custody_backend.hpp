// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <sigwire/rpc/http/client.hpp>
#include <sigwire/signer/custody_backend.hpp>

namespace sigwire::signer {

//! \brief Custody backend REST API client
//!   POST /v1/signatures         {account, payload, digest, idempotency_key} -> {signature}
//!   GET  /v1/signatures/{key}   -> {signature} or 404
//!   GET  /v1/health             -> 200 when able to sign
class HttpCustodyBackend : public CustodyBackend {
  public:
    HttpCustodyBackend(std::unique_ptr<rpc::http::Client> http_client, std::string api_key);

    Task<Bytes> request_signature(const SignatureRequest& request) override;
    Task<std::optional<Bytes>> find_signature(const std::string& idempotency_key) override;
    Task<bool> is_available() override;

  private:
    Task<rpc::http::Response> send(rpc::http::Request request);

    std::unique_ptr<rpc::http::Client> http_client_;
    std::string api_key_;
};

}  // namespace sigwire::signer
