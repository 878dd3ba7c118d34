// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <sigwire/infra/common/log.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace sigwire::rpc::http {

namespace beast = boost::beast;

std::optional<Url> parse_url(std::string_view url) {
    static constexpr std::string_view kScheme{"http://"};
    if (!absl::StartsWithIgnoreCase(url, kScheme)) {
        return std::nullopt;
    }
    url.remove_prefix(kScheme.size());

    Url result;
    const auto path_start{url.find('/')};
    std::string_view authority{url.substr(0, path_start)};
    if (path_start != std::string_view::npos) {
        result.base_path = url.substr(path_start);
        while (!result.base_path.empty() && result.base_path.back() == '/') {
            result.base_path.pop_back();
        }
    }

    const auto port_start{authority.rfind(':')};
    if (port_start != std::string_view::npos) {
        const std::string_view port{authority.substr(port_start + 1)};
        uint32_t port_number{0};
        if (!absl::SimpleAtoi(port, &port_number) || port_number == 0 || port_number > 65535) {
            return std::nullopt;
        }
        result.port = std::string{port};
        authority = authority.substr(0, port_start);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    result.host = std::string{authority};
    return result;
}

BeastClient::BeastClient(boost::asio::any_io_executor executor, Url url, std::chrono::milliseconds timeout)
    : executor_{std::move(executor)}, url_{std::move(url)}, timeout_{timeout} {}

Task<Response> BeastClient::send(Request request) {
    beast::http::request<beast::http::string_body> req{request.method, url_.base_path + request.target, 11};
    req.set(beast::http::field::host, url_.host);
    req.set(beast::http::field::user_agent, "sigwire");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.set(beast::http::field::content_type, "application/json");
        req.body() = std::move(request.body);
        req.prepare_payload();
    }

    bool request_sent{false};
    try {
        boost::asio::ip::tcp::resolver resolver{executor_};
        const auto endpoints = co_await resolver.async_resolve(url_.host, url_.port, boost::asio::use_awaitable);

        beast::tcp_stream stream{executor_};
        stream.expires_after(timeout_);
        co_await stream.async_connect(endpoints, boost::asio::use_awaitable);

        SIGW_TRACE << "BeastClient::send " << req.method_string() << " " << req.target() << " " << req.body();
        co_await beast::http::async_write(stream, req, boost::asio::use_awaitable);
        request_sent = true;

        beast::flat_buffer buffer;
        beast::http::response<beast::http::string_body> res;
        co_await beast::http::async_read(stream, buffer, res, boost::asio::use_awaitable);
        SIGW_TRACE << "BeastClient::send status=" << res.result_int() << " body=" << res.body();

        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            SIGW_DEBUG << "BeastClient::send shutdown failed: " << ec.message();
        }

        co_return Response{.status = res.result_int(), .body = std::move(res.body())};
    } catch (const boost::system::system_error& se) {
        if (se.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        SIGW_DEBUG << "BeastClient::send " << url_.host << ":" << url_.port << " failed: " << se.code().message()
                   << " request_sent=" << request_sent;
        throw TransportError{se.code(), request_sent};
    }
}

}  // namespace sigwire::rpc::http
