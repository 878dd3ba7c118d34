// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_mutex.hpp"

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <sigwire/infra/concurrency/sleep.hpp>
#include <sigwire/infra/test_util/task_runner.hpp>

namespace sigwire::concurrency {

using namespace std::chrono_literals;

TEST_CASE("AwaitableMutex.lock_unlock") {
    test_util::TaskRunner runner;
    AwaitableMutex mutex{runner.executor()};

    runner.run(mutex.lock());
    CHECK_FALSE(mutex.try_lock());
    mutex.unlock();
    CHECK(mutex.try_lock());
    mutex.unlock();
}

TEST_CASE("AwaitableMutex.unlock_without_lock_throws") {
    test_util::TaskRunner runner;
    AwaitableMutex mutex{runner.executor()};
    CHECK_THROWS_AS(mutex.unlock(), std::logic_error);
}

TEST_CASE("AwaitableMutex.second_locker_waits") {
    test_util::TaskRunner runner;
    AwaitableMutex mutex{runner.executor()};
    REQUIRE(mutex.try_lock());

    auto future = runner.spawn_future(mutex.lock());
    runner.poll_until_idle();
    CHECK(future.wait_for(0s) == std::future_status::timeout);

    mutex.unlock();
    runner.poll_context_until_future_is_ready(future);
    CHECK_FALSE(mutex.try_lock());
}

TEST_CASE("AwaitableLockGuard.releases_on_destruction") {
    test_util::TaskRunner runner;
    auto mutex = std::make_shared<AwaitableMutex>(runner.executor());
    REQUIRE(mutex->try_lock());
    {
        AwaitableLockGuard guard{mutex};
        CHECK(guard.owns_lock());
    }
    CHECK(mutex->try_lock());
    mutex->unlock();
}

TEST_CASE("AwaitableLockGuard.early_unlock") {
    test_util::TaskRunner runner;
    auto mutex = std::make_shared<AwaitableMutex>(runner.executor());
    REQUIRE(mutex->try_lock());
    AwaitableLockGuard guard{mutex};
    guard.unlock();
    CHECK_FALSE(guard.owns_lock());
    CHECK(mutex->try_lock());
    mutex->unlock();
}

TEST_CASE("KeyedMutex.serializes_same_key") {
    test_util::TaskRunner runner;
    KeyedMutex<std::string> mutexes{runner.executor()};
    std::vector<std::string> trace;

    auto critical_section = [&](std::string key, std::string tag) -> Task<void> {
        auto guard = co_await mutexes.lock(key);
        trace.push_back(tag + ".enter");
        co_await sleep(1ms);
        trace.push_back(tag + ".exit");
    };

    auto f1 = runner.spawn_future(critical_section("a", "1"));
    auto f2 = runner.spawn_future(critical_section("a", "2"));
    runner.poll_context_until_future_is_ready(f1);
    runner.poll_context_until_future_is_ready(f2);

    CHECK(trace == std::vector<std::string>{"1.enter", "1.exit", "2.enter", "2.exit"});
    CHECK(mutexes.size() == 0);
}

TEST_CASE("KeyedMutex.distinct_keys_do_not_contend") {
    test_util::TaskRunner runner;
    KeyedMutex<std::string> mutexes{runner.executor()};
    std::vector<std::string> trace;

    auto critical_section = [&](std::string key) -> Task<void> {
        auto guard = co_await mutexes.lock(key);
        trace.push_back(key + ".enter");
        co_await sleep(5ms);
        trace.push_back(key + ".exit");
    };

    auto f1 = runner.spawn_future(critical_section("a"));
    auto f2 = runner.spawn_future(critical_section("b"));
    runner.poll_context_until_future_is_ready(f1);
    runner.poll_context_until_future_is_ready(f2);

    REQUIRE(trace.size() == 4);
    CHECK(trace[0] == "a.enter");
    CHECK(trace[1] == "b.enter");
    CHECK(mutexes.size() == 0);
}

TEST_CASE("KeyedMutex.drops_keys_no_longer_in_use") {
    test_util::TaskRunner runner;
    KeyedMutex<std::string> mutexes{runner.executor()};

    AwaitableLockGuard first = runner.run(mutexes.lock("a"));
    auto waiter = runner.spawn_future(mutexes.lock("a"));
    runner.poll_until_idle();
    AwaitableLockGuard other = runner.run(mutexes.lock("b"));
    CHECK(mutexes.size() == 2);

    first.unlock();
    CHECK(mutexes.size() == 2);  // still held by the waiter
    runner.poll_context_until_future_is_ready(waiter);
    AwaitableLockGuard second = waiter.get();
    CHECK(second.owns_lock());

    second.unlock();
    CHECK(mutexes.size() == 1);
    other.unlock();
    CHECK(mutexes.size() == 0);

    // A released key is issued afresh
    AwaitableLockGuard again = runner.run(mutexes.lock("a"));
    CHECK(again.owns_lock());
    CHECK(mutexes.size() == 1);
}

}  // namespace sigwire::concurrency
