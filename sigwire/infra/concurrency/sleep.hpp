// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire {

Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace sigwire
