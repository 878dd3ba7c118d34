// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_mutex.hpp"

#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <sigwire/infra/common/ensure.hpp>

namespace sigwire::concurrency {

AwaitableMutex::AwaitableMutex(const boost::asio::any_io_executor& executor) : token_{executor, 1} {
    token_.try_send(boost::system::error_code{});
}

Task<void> AwaitableMutex::lock() {
    try {
        co_await token_.async_receive(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::asio::experimental::error::channel_cancelled) {
            throw boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
        }
        throw;
    }
}

bool AwaitableMutex::try_lock() {
    return token_.try_receive([](boost::system::error_code) {});
}

void AwaitableMutex::unlock() {
    ensure(token_.try_send(boost::system::error_code{}), "AwaitableMutex::unlock mutex is not locked");
}

AwaitableLockGuard& AwaitableLockGuard::operator=(AwaitableLockGuard&& other) noexcept {
    if (this != &other) {
        unlock();
        mutex_ = std::move(other.mutex_);
    }
    return *this;
}

void AwaitableLockGuard::unlock() noexcept {
    if (mutex_) {
        // The token slot is empty while this guard owns the lock, so giving the token back cannot fail
        mutex_->unlock();
        mutex_.reset();
    }
}

}  // namespace sigwire::concurrency
