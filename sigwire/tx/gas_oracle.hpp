// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <sigwire/chain/client.hpp>
#include <sigwire/common/types.hpp>
#include <sigwire/infra/concurrency/task.hpp>

namespace sigwire::tx {

inline constexpr uint32_t kDefaultGasLimitMarginPercent{120};

//! \brief Completes missing gas parameters from chain state.
//! Runs once per logical request so that every re-signing and resubmission carries identical content.
class GasOracle {
  public:
    explicit GasOracle(chain::Client& chain, uint32_t gas_limit_margin_percent = kDefaultGasLimitMarginPercent)
        : chain_{chain}, gas_limit_margin_percent_{gas_limit_margin_percent} {}

    //! \brief Fills in whatever the request leaves unset, explicit values are kept as given
    //! \throws ChainRejectedError when the node refuses to estimate the call (e.g. it reverts)
    Task<GasParameters> complete(const TransactionRequest& request);

  private:
    Task<uint64_t> estimate_gas_limit(const TransactionRequest& request);

    chain::Client& chain_;
    uint32_t gas_limit_margin_percent_;
};

}  // namespace sigwire::tx
