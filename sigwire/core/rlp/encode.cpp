// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace sigwire::rlp {

//! Offsets of the long form prefixes: 0xB7 + length of length for strings, 0xF7 + length of length for lists
static constexpr uint8_t kLongStringOffset{kEmptyStringCode + 55};
static constexpr uint8_t kLongListOffset{kEmptyListCode + 55};

//! A single byte below 0x80 is its own encoding
static bool is_self_encoded(ByteView s) noexcept { return s.size() == 1 && s[0] < kEmptyStringCode; }

void encode_header(Bytes& to, Header header) {
    if (header.payload_length < 56) {
        to.push_back(static_cast<uint8_t>((header.list ? kEmptyListCode : kEmptyStringCode) + header.payload_length));
        return;
    }
    const ByteView length_be{endian::to_big_compact(header.payload_length)};
    to.push_back(static_cast<uint8_t>((header.list ? kLongListOffset : kLongStringOffset) + length_be.size()));
    to.append(length_be);
}

size_t length_of_length(uint64_t payload_length) noexcept {
    return payload_length < 56 ? 1 : 1 + intx::count_significant_bytes(payload_length);
}

void encode(Bytes& to, bool x) { to.push_back(x ? uint8_t{1} : kEmptyStringCode); }

void encode(Bytes& to, ByteView s) {
    if (!is_self_encoded(s)) {
        encode_header(to, {.list = false, .payload_length = s.size()});
    }
    to.append(s);
}

size_t length(ByteView s) noexcept { return is_self_encoded(s) ? 1 : s.size() + length_of_length(s.size()); }

}  // namespace sigwire::rlp
