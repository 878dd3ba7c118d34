// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <sigwire/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

namespace sigwire::concurrency {

//! \brief Mutual exclusion for coroutines: waiting for the lock suspends the caller instead of blocking the thread.
//! Ownership is modelled as a single token travelling through a channel of capacity one.
class AwaitableMutex {
  public:
    explicit AwaitableMutex(const boost::asio::any_io_executor& executor);

    AwaitableMutex(const AwaitableMutex&) = delete;
    AwaitableMutex& operator=(const AwaitableMutex&) = delete;

    Task<void> lock();
    bool try_lock();

    //! \throws std::logic_error if the mutex is not locked
    void unlock();

  private:
    boost::asio::experimental::concurrent_channel<void(boost::system::error_code)> token_;
};

//! \brief RAII ownership of an AwaitableMutex, with optional early release
class [[nodiscard]] AwaitableLockGuard {
  public:
    AwaitableLockGuard() = default;
    explicit AwaitableLockGuard(std::shared_ptr<AwaitableMutex> mutex) : mutex_{std::move(mutex)} {}
    ~AwaitableLockGuard() { unlock(); }

    AwaitableLockGuard(AwaitableLockGuard&& other) noexcept : mutex_{std::move(other.mutex_)} {}
    AwaitableLockGuard& operator=(AwaitableLockGuard&& other) noexcept;

    AwaitableLockGuard(const AwaitableLockGuard&) = delete;
    AwaitableLockGuard& operator=(const AwaitableLockGuard&) = delete;

    bool owns_lock() const { return mutex_ != nullptr; }

    void unlock() noexcept;

  private:
    std::shared_ptr<AwaitableMutex> mutex_;
};

//! \brief One AwaitableMutex per key, created on first use and dropped once no guard or waiter holds it.
//! Callers on distinct keys never contend, callers on the same key are serialized in arrival order.
//! Guards must not outlive the KeyedMutex that issued them.
template <typename Key, typename Hash = std::hash<Key>>
class KeyedMutex {
  public:
    explicit KeyedMutex(boost::asio::any_io_executor executor) : executor_{std::move(executor)} {}

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    Task<AwaitableLockGuard> lock(const Key& key) {
        auto mutex = mutex_for(key);
        co_await mutex->lock();
        co_return AwaitableLockGuard{std::move(mutex)};
    }

    //! Number of keys currently locked or waited for
    size_t size() const {
        std::scoped_lock lock{map_mutex_};
        return mutexes_.size();
    }

  private:
    std::shared_ptr<AwaitableMutex> mutex_for(const Key& key) {
        std::scoped_lock lock{map_mutex_};
        auto& entry = mutexes_[key];
        auto mutex = entry.lock();
        if (!mutex) {
            auto release = [this, key](AwaitableMutex* unused) {
                erase_if_unused(key);
                delete unused;
            };
            mutex = std::shared_ptr<AwaitableMutex>{new AwaitableMutex{executor_}, std::move(release)};
            entry = mutex;
        }
        return mutex;
    }

    void erase_if_unused(const Key& key) {
        std::scoped_lock lock{map_mutex_};
        const auto it = mutexes_.find(key);
        // A new mutex may have been issued for the key meanwhile
        if (it != mutexes_.end() && it->second.expired()) {
            mutexes_.erase(it);
        }
    }

    boost::asio::any_io_executor executor_;
    mutable std::mutex map_mutex_;
    std::unordered_map<Key, std::weak_ptr<AwaitableMutex>, Hash> mutexes_;
};

}  // namespace sigwire::concurrency
