// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <sigwire/infra/common/log.hpp>
#include <sigwire/service/request.hpp>
#include <sigwire/service/settings.hpp>

namespace sigwire::cmd::common {

//! CLI11 validator for a 0x-prefixed account address, mixed case must carry a valid checksum
struct AddressValidator : public CLI::Validator {
    explicit AddressValidator();
};

//! CLI11 validator for an http(s) endpoint URL
struct UrlValidator : public CLI::Validator {
    explicit UrlValidator(bool allow_empty = false);
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options, environment variables and config file keys to populate service settings after cli.parse()
void add_service_options(CLI::App& cli, ServiceSettings& settings);

//! \brief Set up the token and account options shared by the account subcommands
void add_tba_options(CLI::App& cli, TbaParameters& parameters);

}  // namespace sigwire::cmd::common
