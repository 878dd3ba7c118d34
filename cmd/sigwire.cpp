// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <memory>

#include <CLI/CLI.hpp>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/types/address.hpp>
#include <sigwire/infra/common/log.hpp>
#include <sigwire/infra/concurrency/task.hpp>
#include <sigwire/service/request.hpp>
#include <sigwire/service/service.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "common/common.hpp"

using namespace sigwire;
using namespace sigwire::cmd::common;

//! Process exit codes
enum ExitCode : int {
    kSuccess = 0,
    kFailure = 1,
    kInvalidInput = 2,
    kTransactionFailed = 3,  // mined but reverted, or superseded
};

static Task<int> send(Service& service, const SendParameters& parameters) {
    co_await service.start();
    const TransactionOutcome outcome{co_await service.send_transaction(parameters)};
    std::cout << outcome.hash << "\n";
    if (outcome.status != TransactionStatus::kConfirmed) {
        SIGW_ERROR << "Transaction " << outcome.hash << " nonce=" << outcome.nonce << " " << to_string(outcome.status)
                   << ": " << outcome.reason;
        co_return kTransactionFailed;
    }
    SIGW_INFO << "Transaction " << outcome.hash << " confirmed nonce=" << outcome.nonce;
    co_return kSuccess;
}

static Task<int> create_tba(Service& service, const TbaParameters& parameters) {
    co_await service.start();
    const tba::AccountAddress account{co_await service.create_tba(parameters)};
    std::cout << address_to_checksum_hex(account.address) << "\n";
    if (account.deployment_hash) {
        SIGW_INFO << "Account " << account.address << " deployed by " << *account.deployment_hash;
    } else {
        SIGW_INFO << "Account " << account.address << " already deployed";
    }
    co_return kSuccess;
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Sigwire - custody signed transaction submission and ERC-6551 account provisioning"};
    cli.set_config("--config", "", "Read options from a TOML or INI file");
    cli.require_subcommand(1);

    ServiceSettings settings;
    SendParameters send_parameters;
    TbaParameters tba_parameters;

    try {
        // Parse and validate program arguments
        add_logging_options(cli, settings.log_settings);
        add_service_options(cli, settings);

        auto* send_cmd = cli.add_subcommand("send", "Sign, submit and confirm a transaction");
        send_cmd->add_option("--from", send_parameters.from, "Sender address")->required()->check(AddressValidator{});
        send_cmd->add_option("--to", send_parameters.to, "Recipient address")->required();
        send_cmd->add_option("--value", send_parameters.value, "Amount in wei, decimal or 0x hex")
            ->capture_default_str();
        send_cmd->add_option("--data", send_parameters.data, "Call data as hex");

        auto* create_cmd = cli.add_subcommand("create-tba", "Deploy the token bound account of a token unless present");
        add_tba_options(*create_cmd, tba_parameters);
        auto* derive_cmd = cli.add_subcommand("derive-tba", "Compute the token bound account address of a token");
        add_tba_options(*derive_cmd, tba_parameters);

        cli.parse(argc, argv);
        log::init(settings.log_settings);

        if (*derive_cmd) {
            std::cout << address_to_checksum_hex(derive_tba(tba_parameters, settings)) << "\n";
            return kSuccess;
        }

        boost::asio::io_context ioc;
        std::unique_ptr<Service> service{Service::connect(ioc.get_executor(), settings)};
        auto result = *send_cmd ? boost::asio::co_spawn(ioc, send(*service, send_parameters), boost::asio::use_future)
                                : boost::asio::co_spawn(ioc, create_tba(*service, tba_parameters), boost::asio::use_future);
        ioc.run();
        return result.get();
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    } catch (const ValidationError& e) {
        SIGW_ERROR << "Invalid input: " << e.what();
        return kInvalidInput;
    } catch (const Error& e) {
        SIGW_ERROR << e.what();
        return kFailure;
    } catch (const std::exception& e) {
        SIGW_CRIT << "Unexpected exception: " << e.what();
        return kFailure;
    }
}
