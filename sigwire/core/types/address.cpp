// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <ethash/keccak.hpp>

#include <sigwire/core/common/util.hpp>
#include <sigwire/core/rlp/encode.hpp>

namespace sigwire {

namespace rlp {

    void encode(Bytes& to, const evmc::address& address) {
        encode(to, ByteView{address.bytes});
    }

    size_t length(const evmc::address& address) noexcept {
        return length(ByteView{address.bytes});
    }

}  // namespace rlp

evmc::address create2_address(const evmc::address& caller, const evmc::bytes32& salt,
                              const uint8_t (&code_hash)[32]) noexcept {
    static constexpr size_t kN{1 + kAddressLength + 2 * kHashLength};
    uint8_t buf[kN];

    buf[0] = 0xff;
    std::memcpy(buf + 1, caller.bytes, kAddressLength);
    std::memcpy(buf + 1 + kAddressLength, salt.bytes, kHashLength);
    std::memcpy(buf + 1 + kAddressLength + kHashLength, code_hash, kHashLength);

    ethash::hash256 hash{ethash::keccak256(buf, kN)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    const evmc::address address{bytes_to_address(*bytes)};

    const auto digits{hex.substr(2)};
    const bool has_lower{std::any_of(digits.begin(), digits.end(), [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; })};
    const bool has_upper{std::any_of(digits.begin(), digits.end(), [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; })};
    if (has_lower && has_upper && address_to_checksum_hex(address).substr(2) != digits) {
        return std::nullopt;
    }
    return address;
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

std::string address_to_checksum_hex(const evmc::address& address) {
    std::string lower{to_hex(ByteView{address.bytes})};
    const auto hash{keccak256(ByteView{reinterpret_cast<const uint8_t*>(lower.data()), lower.size()})};
    for (size_t i{0}; i < lower.size(); ++i) {
        const uint8_t nibble = (i % 2 == 0) ? (hash.bytes[i / 2] >> 4) : (hash.bytes[i / 2] & 0x0f);
        if (nibble >= 8) {
            lower[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[i])));
        }
    }
    return "0x" + lower;
}

}  // namespace sigwire

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << sigwire::address_to_hex(address);
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& bytes32) {
    return out << sigwire::to_hex(sigwire::ByteView{bytes32.bytes}, true);
}

}  // namespace evmc
