// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <string_view>

#include <sigwire/core/common/bytes_to_string.hpp>
#include <sigwire/core/common/util.hpp>
#include <sigwire/core/types/address.hpp>

namespace sigwire::tba {

namespace {

    // ERC-1167 minimal proxy split around the implementation address
    constexpr uint8_t kProxyHeader[]{0x3d, 0x60, 0xad, 0x80, 0x60, 0x0a, 0x3d, 0x39, 0x81, 0xf3,
                                     0x36, 0x3d, 0x3d, 0x37, 0x3d, 0x3d, 0x3d, 0x36, 0x3d, 0x73};
    constexpr uint8_t kProxyFooter[]{0x5a, 0xf4, 0x3d, 0x82, 0x80, 0x3e, 0x90, 0x3d,
                                     0x91, 0x60, 0x2b, 0x57, 0xfd, 0x5b, 0xf3};

    void append_word(Bytes& to, const intx::uint256& value) {
        uint8_t word[32];
        intx::be::store(word, value);
        to.append(word, sizeof(word));
    }

    void append_word(Bytes& to, const evmc::address& address) {
        to.append(12, 0);
        to.append(address.bytes, kAddressLength);
    }

    void append_word(Bytes& to, const evmc::bytes32& word) {
        to.append(word.bytes, kHashLength);
    }

    void append_arguments(Bytes& to, const evmc::address& implementation, const evmc::bytes32& salt,
                          const intx::uint256& chain_id, const evmc::address& token_contract,
                          const intx::uint256& token_id) {
        append_word(to, implementation);
        append_word(to, salt);
        append_word(to, chain_id);
        append_word(to, token_contract);
        append_word(to, token_id);
    }

    Bytes selector(std::string_view signature) {
        const auto hash{keccak256(string_view_to_byte_view(signature))};
        return Bytes{hash.bytes, 4};
    }

}  // namespace

Bytes account_init_code(const evmc::address& implementation, const evmc::bytes32& salt,
                        const intx::uint256& chain_id, const evmc::address& token_contract,
                        const intx::uint256& token_id) {
    Bytes code;
    code.reserve(kAccountInitCodeLength);
    code.append(kProxyHeader, sizeof(kProxyHeader));
    code.append(implementation.bytes, kAddressLength);
    code.append(kProxyFooter, sizeof(kProxyFooter));
    append_word(code, salt);
    append_word(code, chain_id);
    append_word(code, token_contract);
    append_word(code, token_id);
    SIGWIRE_ASSERT(code.size() == kAccountInitCodeLength);
    return code;
}

evmc::address derive_account_address(const evmc::address& registry, const evmc::address& implementation,
                                     const evmc::bytes32& salt, const intx::uint256& chain_id,
                                     const evmc::address& token_contract, const intx::uint256& token_id) {
    const Bytes init_code{account_init_code(implementation, salt, chain_id, token_contract, token_id)};
    const auto code_hash{keccak256(init_code)};
    return create2_address(registry, salt, code_hash.bytes);
}

Bytes create_account_calldata(const evmc::address& implementation, const evmc::bytes32& salt,
                              const intx::uint256& chain_id, const evmc::address& token_contract,
                              const intx::uint256& token_id) {
    Bytes data{selector("createAccount(address,bytes32,uint256,address,uint256)")};
    append_arguments(data, implementation, salt, chain_id, token_contract, token_id);
    return data;
}

Bytes account_calldata(const evmc::address& implementation, const evmc::bytes32& salt,
                       const intx::uint256& chain_id, const evmc::address& token_contract,
                       const intx::uint256& token_id) {
    Bytes data{selector("account(address,bytes32,uint256,address,uint256)")};
    append_arguments(data, implementation, salt, chain_id, token_contract, token_id);
    return data;
}

}  // namespace sigwire::tba
