// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>

namespace sigwire::tba {

static constexpr auto kImplementation{0x55266d75d1a14e4572138116af39863ed6596e7f_address};
static constexpr auto kCollection{0xbc4ca0eda7647a8ab7c2061c2e118a18a936f13d_address};

TEST_CASE("account_init_code layout") {
    const Bytes code{account_init_code(kImplementation, kDefaultSalt, 1, kCollection, 7)};
    REQUIRE(code.size() == kAccountInitCodeLength);
    CHECK(to_hex(code.substr(0, 20)) == "3d60ad80600a3d3981f3363d3d373d3d3d363d73");
    CHECK(to_hex(code.substr(20, 20)) == "55266d75d1a14e4572138116af39863ed6596e7f");
    CHECK(to_hex(code.substr(40, 15)) == "5af43d82803e903d91602b57fd5bf3");
    CHECK(to_hex(code.substr(55, 32)) == std::string(64, '0'));
    CHECK(code[55 + 63] == 1);
    CHECK(to_hex(code.substr(55 + 64 + 12, 20)) == "bc4ca0eda7647a8ab7c2061c2e118a18a936f13d");
    CHECK(code.back() == 7);
    CHECK(to_hex(ByteView{keccak256(code).bytes}) ==
          "d0481b650d7288b23a4c388d0da2d511f173331eed44a4d5b31198ea781d3815");
}

TEST_CASE("derive_account_address") {
    const auto base{derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, 1, kCollection, 7)};
    CHECK(base == 0xe5409f9524ec9662724d1555c2e72958bd99d567_address);

    SECTION("deterministic") {
        CHECK(derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, 1, kCollection, 7) == base);
    }

    SECTION("every input changes the address") {
        CHECK(derive_account_address(kDefaultRegistry, kImplementation,
                                     0x0000000000000000000000000000000000000000000000000000000000000001_bytes32,
                                     1, kCollection, 7) == 0xb89df98694dc123513c7dff41233690c1fec4885_address);
        CHECK(derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, 137, kCollection, 7) ==
              0xedfdf99613dcec65bcecb652717bdaded2b994c3_address);
        CHECK(derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, 1, kCollection, 8) ==
              0xc0c647b3bf1866d80f9711945d6e495c0059559e_address);
        CHECK(derive_account_address(kDefaultRegistry, 0x1111111111111111111111111111111111111111_address,
                                     kDefaultSalt, 1, kCollection, 7) ==
              0x72d5ffee93e180f780a28b294f14a0f0dae991ca_address);
        CHECK(derive_account_address(kDefaultRegistry, kImplementation, kDefaultSalt, 1,
                                     0x2222222222222222222222222222222222222222_address, 7) ==
              0x17a704bd06ba164f0e42aa21e703e6f479cd4cb1_address);
        CHECK(derive_account_address(0x3333333333333333333333333333333333333333_address, kImplementation,
                                     kDefaultSalt, 1, kCollection, 7) ==
              0x00a8413a93da0db8fba3e0d259ffcf5d48f94786_address);
    }
}

TEST_CASE("create_account_calldata") {
    const Bytes data{create_account_calldata(kImplementation, kDefaultSalt, 1, kCollection, 7)};
    REQUIRE(data.size() == 4 + 5 * 32);
    CHECK(to_hex(data.substr(0, 4)) == "8a54c52f");
    CHECK(to_hex(data.substr(4 + 12, 20)) == "55266d75d1a14e4572138116af39863ed6596e7f");
    CHECK(data[4 + 3 * 32 - 1] == 1);
    CHECK(to_hex(data.substr(4 + 3 * 32 + 12, 20)) == "bc4ca0eda7647a8ab7c2061c2e118a18a936f13d");
    CHECK(data.back() == 7);

    const Bytes view_call{account_calldata(kImplementation, kDefaultSalt, 1, kCollection, 7)};
    CHECK(to_hex(view_call.substr(0, 4)) == "246a0021");
    CHECK(view_call.substr(4) == data.substr(4));
}

}  // namespace sigwire::tba
