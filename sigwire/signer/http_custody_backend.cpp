// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_custody_backend.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/rpc/json/types.hpp>

namespace sigwire::signer {

namespace http = rpc::http;

static constexpr std::string_view kSignaturesPath{"/v1/signatures"};
static constexpr std::string_view kHealthPath{"/v1/health"};

static std::string error_message(const http::Response& response) {
    const auto body = nlohmann::json::parse(response.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return "HTTP status " + std::to_string(response.status);
}

static Bytes parse_signature(const http::Response& response) {
    const auto body = nlohmann::json::parse(response.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (!body.is_object() || !body.contains("signature") || !body["signature"].is_string()) {
        throw SignerRejectedError{"custody reply carries no signature"};
    }
    try {
        return rpc::from_data(body["signature"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw SignerRejectedError{std::string{"custody reply carries a malformed signature: "} + e.what()};
    }
}

//! Too many requests and unavailable service are refusals, the backend did not act on the request
static bool is_refusal(unsigned int status) {
    return status == 429 || status == 503;
}

HttpCustodyBackend::HttpCustodyBackend(std::unique_ptr<http::Client> http_client, std::string api_key)
    : http_client_{std::move(http_client)}, api_key_{std::move(api_key)} {}

Task<http::Response> HttpCustodyBackend::send(http::Request request) {
    request.headers.emplace_back("Authorization", "Bearer " + api_key_);
    request.headers.emplace_back("Accept", "application/json");
    try {
        co_return co_await http_client_->send(std::move(request));
    } catch (const http::TransportError& e) {
        throw SignerUnavailableError{std::string{"custody backend unreachable: "} + e.what(), e.request_sent()};
    }
}

Task<Bytes> HttpCustodyBackend::request_signature(const SignatureRequest& request) {
    const nlohmann::json body{
        {"account", request.account},
        {"payload", rpc::to_data(request.payload)},
        {"digest", request.digest},
        {"idempotency_key", request.idempotency_key},
    };
    const auto response = co_await send({
        .method = boost::beast::http::verb::post,
        .target = std::string{kSignaturesPath},
        .headers = {{"Idempotency-Key", request.idempotency_key}},
        .body = body.dump(),
    });

    if (response.is_success()) {
        co_return parse_signature(response);
    }
    const std::string message{error_message(response)};
    SIGW_DEBUG << "HttpCustodyBackend::request_signature key=" << request.idempotency_key
               << " status=" << response.status << " error=" << message;
    if (response.status >= 500 || response.status == 429) {
        throw SignerUnavailableError{message, /*outcome_unknown=*/!is_refusal(response.status)};
    }
    throw SignerRejectedError{message};
}

Task<std::optional<Bytes>> HttpCustodyBackend::find_signature(const std::string& idempotency_key) {
    const auto response = co_await send({
        .method = boost::beast::http::verb::get,
        .target = std::string{kSignaturesPath} + "/" + idempotency_key,
        .headers = {},
        .body = {},
    });
    if (response.status == 404) {
        co_return std::nullopt;
    }
    if (!response.is_success()) {
        throw SignerUnavailableError{"signature lookup failed: " + error_message(response), /*outcome_unknown=*/true};
    }
    co_return parse_signature(response);
}

Task<bool> HttpCustodyBackend::is_available() {
    try {
        const auto response = co_await send({
            .method = boost::beast::http::verb::get,
            .target = std::string{kHealthPath},
            .headers = {},
            .body = {},
        });
        co_return response.is_success();
    } catch (const SignerUnavailableError& e) {
        SIGW_WARN << "HttpCustodyBackend::is_available: " << e.what();
    }
    co_return false;
}

}  // namespace sigwire::signer
