// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <sigwire/common/errors.hpp>
#include <sigwire/core/common/util.hpp>

namespace sigwire {

using namespace evmc::literals;

static constexpr auto kImplementation{0x41c8f39463a868d3a88af00cd0fe7102f30e44ec_address};

TEST_CASE("parse_address", "[service]") {
    CHECK(parse_address("recipient", "0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b") ==
          0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b_address);
    CHECK(parse_address("recipient", "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf") ==
          0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address);

    CHECK_THROWS_AS(parse_address("recipient", ""), ValidationError);
    CHECK_THROWS_AS(parse_address("recipient", "0xb94f5374fce5edbc8e2a8697c15331677e6ebf"), ValidationError);
    CHECK_THROWS_AS(parse_address("recipient", "b94f5374fce5edbc8e2a8697c15331677e6ebf0b"), ValidationError);
    CHECK_THROWS_AS(parse_address("recipient", "0xz94f5374fce5edbc8e2a8697c15331677e6ebf0b"), ValidationError);
    // bad checksum
    CHECK_THROWS_AS(parse_address("recipient", "0x7e5F4552091A69125d5DfCb7b8C2659029395Bdf"), ValidationError);

    try {
        parse_address("recipient", "0x1234");
        FAIL("ValidationError expected");
    } catch (const ValidationError& e) {
        CHECK(std::string{e.what()}.starts_with("invalid recipient \"0x1234\""));
    }
}

TEST_CASE("parse_quantity", "[service]") {
    CHECK(parse_quantity("value", "0") == 0);
    CHECK(parse_quantity("value", "100") == 100);
    CHECK(parse_quantity("value", "0x64") == 100);
    CHECK(parse_quantity("value", "1000000000000000000") == intx::uint256{1'000'000'000'000'000'000});

    CHECK_THROWS_AS(parse_quantity("value", ""), ValidationError);
    CHECK_THROWS_AS(parse_quantity("value", "-1"), ValidationError);
    CHECK_THROWS_AS(parse_quantity("value", "1.5"), ValidationError);
    CHECK_THROWS_AS(parse_quantity("value", "ten"), ValidationError);
}

TEST_CASE("parse_data", "[service]") {
    CHECK(parse_data("data", "").empty());
    CHECK(parse_data("data", "0x") == Bytes{});
    CHECK(parse_data("data", "0x8a54c52f") == *from_hex("8a54c52f"));
    CHECK_THROWS_AS(parse_data("data", "0x8a5g"), ValidationError);
    CHECK_THROWS_AS(parse_data("data", "0xgg"), ValidationError);
}

TEST_CASE("parse_salt", "[service]") {
    CHECK(parse_salt("salt", "0") == evmc::bytes32{});
    CHECK(parse_salt("salt", "1") == 0x0000000000000000000000000000000000000000000000000000000000000001_bytes32);
    CHECK(parse_salt("salt", "0xff00") == 0x000000000000000000000000000000000000000000000000000000000000ff00_bytes32);
    CHECK_THROWS_AS(parse_salt("salt", "salt"), ValidationError);
}

TEST_CASE("make_transaction_request", "[service]") {
    const TransactionRequest request{make_transaction_request({
        .from = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf",
        .to = "0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b",
        .value = "100",
        .data = "0x01",
    })};
    CHECK(request.from == 0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address);
    CHECK(request.to == 0xb94f5374fce5edbc8e2a8697c15331677e6ebf0b_address);
    CHECK(request.value == 100);
    CHECK(request.data == Bytes{0x01});
    CHECK(request.type == TransactionType::kDynamicFee);
    CHECK(request.gas == GasParameters{});

    CHECK_THROWS_AS(make_transaction_request({.from = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", .to = "0xnotanaddress"}),
                    ValidationError);
}

TEST_CASE("make_account_request", "[service]") {
    ServiceSettings settings;
    settings.chain_id = 137;
    settings.default_implementation = kImplementation;

    SECTION("defaults") {
        const tba::AccountRequest request{make_account_request(
            {.collection = "0x2222222222222222222222222222222222222222", .token_id = "7"}, settings)};
        CHECK(request.token_contract == 0x2222222222222222222222222222222222222222_address);
        CHECK(request.token_id == 7);
        CHECK(request.implementation == kImplementation);
        CHECK(request.chain_id == 137);
        CHECK(request.salt == tba::kDefaultSalt);
    }

    SECTION("explicit") {
        const tba::AccountRequest request{make_account_request(
            {
                .collection = "0x2222222222222222222222222222222222222222",
                .token_id = "0x07",
                .implementation = "0x3333333333333333333333333333333333333333",
                .token_chain_id = "1",
                .salt = "42",
            },
            settings)};
        CHECK(request.token_id == 7);
        CHECK(request.implementation == 0x3333333333333333333333333333333333333333_address);
        CHECK(request.chain_id == 1);
        CHECK(request.salt == 0x000000000000000000000000000000000000000000000000000000000000002a_bytes32);
    }

    SECTION("no implementation") {
        settings.default_implementation.reset();
        CHECK_THROWS_AS(make_account_request(
                            {.collection = "0x2222222222222222222222222222222222222222", .token_id = "7"}, settings),
                        ValidationError);
    }
}

TEST_CASE("derive_tba", "[service]") {
    ServiceSettings settings;
    settings.default_implementation = kImplementation;
    const TbaParameters parameters{.collection = "0x2222222222222222222222222222222222222222", .token_id = "7"};

    const evmc::address address{derive_tba(parameters, settings)};
    CHECK(address == tba::derive_account_address(tba::kDefaultRegistry, kImplementation, tba::kDefaultSalt, 137,
                                                 0x2222222222222222222222222222222222222222_address, 7));
    CHECK(derive_tba(parameters, settings) == address);

    TbaParameters other_token{parameters};
    other_token.token_id = "8";
    CHECK(derive_tba(other_token, settings) != address);

    TbaParameters other_salt{parameters};
    other_salt.salt = "1";
    CHECK(derive_tba(other_salt, settings) != address);

    settings.registry = 0x4444444444444444444444444444444444444444_address;
    CHECK(derive_tba(parameters, settings) != address);
}

}  // namespace sigwire
