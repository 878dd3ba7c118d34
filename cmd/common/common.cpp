// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <chrono>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <absl/strings/str_split.h>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/rpc/http/client.hpp>

namespace sigwire::cmd::common {

AddressValidator::AddressValidator() {
    name("ADDRESS");
    func_ = [](const std::string& value) -> std::string {
        if (!hex_to_address(value)) {
            return "Value " + value + " is not a valid address";
        }
        return {};
    };
}

UrlValidator::UrlValidator(bool allow_empty) {
    name("URL");
    func_ = [allow_empty](const std::string& value) -> std::string {
        if (value.empty() && allow_empty) {
            return {};
        }
        if (!rpc::http::parse_url(value)) {
            return "Value " + value + " is not a valid http(s) URL";
        }
        return {};
    };
}

//! CLI11 validator for a custody account mapping <address>=<account id>
struct CustodyAccountValidator : public CLI::Validator {
    explicit CustodyAccountValidator() {
        func_ = [](const std::string& value) -> std::string {
            const std::vector<std::string> parts = absl::StrSplit(value, absl::MaxSplits('=', 1));
            if (parts.size() != 2 || parts[1].empty()) {
                return "Value " + value + " is not a custody account mapping <address>=<account id>";
            }
            if (!hex_to_address(parts[0])) {
                return "Value " + parts[0] + " is not a valid address";
            }
            return {};
        };
    }
};

static void add_address_option(CLI::App& cli, const std::string& name, evmc::address& address,
                               const std::string& description, const std::string& env) {
    cli.add_option_function<std::string>(
           name, [&address](const std::string& value) { address = *hex_to_address(value); }, description)
        ->check(AddressValidator{})
        ->envname(env)
        ->default_str(address_to_hex(address));
}

static void add_milliseconds_option(CLI::App& cli, const std::string& name, std::chrono::milliseconds& duration,
                                    const std::string& description, const std::string& env) {
    cli.add_option_function<uint32_t>(
           name, [&duration](uint32_t value) { duration = std::chrono::milliseconds{value}; }, description)
        ->envname(env)
        ->default_str(std::to_string(duration.count()));
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity)
        ->envname("SIGWIRE_LOG_VERBOSITY");
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_service_options(CLI::App& cli, ServiceSettings& settings) {
    auto& chain_opts = *cli.add_option_group("Chain", "Chain node options");
    chain_opts.add_option("--chain.id", settings.chain_id, "Chain id transactions are signed for")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{1}, std::numeric_limits<uint64_t>::max()))
        ->envname("SIGWIRE_CHAIN_ID");
    chain_opts.add_option("--chain.rpc.url", settings.chain_rpc_url, "JSON-RPC endpoint of the chain node")
        ->capture_default_str()
        ->check(UrlValidator{})
        ->envname("SIGWIRE_CHAIN_RPC_URL");

    auto& custody_opts = *cli.add_option_group("Custody", "Custody signing options");
    custody_opts.add_option("--custody.url", settings.custody_url, "Base URL of the custody signing API")
        ->check(UrlValidator{/*allow_empty=*/true})
        ->envname("SIGWIRE_CUSTODY_URL");
    custody_opts.add_option("--custody.api.key", settings.custody_api_key, "API key presented to the custody API")
        ->envname("SIGWIRE_CUSTODY_API_KEY");
    custody_opts
        .add_option_function<std::vector<std::string>>(
            "--custody.accounts",
            [&settings](const std::vector<std::string>& mappings) {
                for (const auto& mapping : mappings) {
                    const std::vector<std::string> parts = absl::StrSplit(mapping, absl::MaxSplits('=', 1));
                    settings.custody_accounts[*hex_to_address(parts[0])] = parts[1];
                }
            },
            "Custody accounts of the senders (comma separated): <address>=<account id>,...")
        ->delimiter(',')
        ->check(CustodyAccountValidator{})
        ->envname("SIGWIRE_CUSTODY_ACCOUNTS");

    auto& tba_opts = *cli.add_option_group("Accounts", "Token bound account options");
    add_address_option(tba_opts, "--tba.registry", settings.registry, "ERC-6551 registry address",
                       "SIGWIRE_TBA_REGISTRY");
    tba_opts
        .add_option_function<std::string>(
            "--tba.implementation",
            [&settings](const std::string& value) { settings.default_implementation = hex_to_address(value); },
            "Account implementation used when a request names none")
        ->check(AddressValidator{})
        ->envname("SIGWIRE_TBA_IMPLEMENTATION");
    tba_opts
        .add_option_function<std::string>(
            "--tba.salt", [&settings](const std::string& value) { settings.default_salt = parse_salt("salt", value); },
            "Account salt used when a request names none")
        ->check(CLI::Validator{[](const std::string& value) -> std::string {
                                   return parse_uint256(value) ? "" : "Value " + value + " is not a valid salt";
                               },
                               "SALT"})
        ->default_str("0")
        ->envname("SIGWIRE_TBA_SALT");
    add_address_option(tba_opts, "--tba.deployer", settings.deployer, "Sender of account deployment transactions",
                       "SIGWIRE_TBA_DEPLOYER");

    auto& tx_opts = *cli.add_option_group("Transactions", "Submission options");
    tx_opts.add_option("--retry.sign.attempts", settings.retry.max_sign_attempts, "Signing attempts while the signer is unavailable")
        ->capture_default_str()
        ->check(CLI::Range(1u, 100u))
        ->envname("SIGWIRE_RETRY_SIGN_ATTEMPTS");
    tx_opts.add_option("--retry.resubmissions", settings.retry.max_resubmissions, "Resubmissions of an unconfirmed transaction")
        ->capture_default_str()
        ->check(CLI::Range(0u, 100u))
        ->envname("SIGWIRE_RETRY_RESUBMISSIONS");
    add_milliseconds_option(tx_opts, "--retry.backoff.initial", settings.retry.initial_backoff,
                            "First backoff delay in milliseconds", "SIGWIRE_RETRY_BACKOFF_INITIAL");
    add_milliseconds_option(tx_opts, "--retry.backoff.max", settings.retry.max_backoff,
                            "Backoff delay cap in milliseconds", "SIGWIRE_RETRY_BACKOFF_MAX");
    add_milliseconds_option(tx_opts, "--broadcast.poll.interval", settings.broadcast.poll_interval,
                            "Receipt polling interval in milliseconds", "SIGWIRE_BROADCAST_POLL_INTERVAL");
    add_milliseconds_option(tx_opts, "--broadcast.timeout", settings.broadcast.confirmation_timeout,
                            "Wait for a receipt before resubmitting, in milliseconds", "SIGWIRE_BROADCAST_TIMEOUT");
    tx_opts.add_option("--gas.margin", settings.gas_limit_margin, "Gas limit as a percentage of the estimate")
        ->capture_default_str()
        ->check(CLI::Range(100u, 1000u))
        ->envname("SIGWIRE_GAS_MARGIN");
    add_milliseconds_option(tx_opts, "--http.timeout", settings.http_timeout,
                            "Timeout of each HTTP request in milliseconds", "SIGWIRE_HTTP_TIMEOUT");
}

void add_tba_options(CLI::App& cli, TbaParameters& parameters) {
    cli.add_option("--collection", parameters.collection, "Token contract owning the account")
        ->required()
        ->check(AddressValidator{});
    cli.add_option("--token-id", parameters.token_id, "Token id owning the account")->required();
    cli.add_option("--implementation", parameters.implementation, "Account implementation address")
        ->check(AddressValidator{});
    cli.add_option("--token-chain-id", parameters.token_chain_id, "Chain the token lives on (default: --chain.id)");
    cli.add_option("--salt", parameters.salt, "Account salt");
}

}  // namespace sigwire::cmd::common
