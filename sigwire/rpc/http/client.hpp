// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sigwire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/system/system_error.hpp>

namespace sigwire::rpc::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Request {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string target;  // path and query, relative to the client base path
    Headers headers;
    std::string body;
};

struct Response {
    unsigned int status{0};
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }
};

//! \brief Failure below the HTTP layer (resolve, connect, I/O, timeout)
class TransportError : public boost::system::system_error {
  public:
    TransportError(const boost::system::error_code& ec, bool request_sent)
        : boost::system::system_error{ec}, request_sent_{request_sent} {}

    //! Whether the request has been fully written before the failure, i.e. the peer may have acted on it
    bool request_sent() const { return request_sent_; }

  private:
    bool request_sent_;
};

//! Plain HTTP endpoint: http://host[:port][/base/path]
struct Url {
    std::string host;
    std::string port{"80"};
    std::string base_path;

    friend bool operator==(const Url&, const Url&) = default;
};

std::optional<Url> parse_url(std::string_view url);

//! \brief Minimal asynchronous HTTP client capability
class Client {
  public:
    virtual ~Client() = default;

    //! \throws TransportError on any failure below the HTTP layer
    virtual Task<Response> send(Request request) = 0;
};

//! \brief Client opening one TCP connection per request using Boost.Beast
class BeastClient : public Client {
  public:
    BeastClient(boost::asio::any_io_executor executor, Url url, std::chrono::milliseconds timeout);

    Task<Response> send(Request request) override;

    const Url& url() const { return url_; }

  private:
    boost::asio::any_io_executor executor_;
    Url url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace sigwire::rpc::http
