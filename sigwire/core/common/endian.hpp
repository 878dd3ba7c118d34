// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <sigwire/core/common/base.hpp>
#include <sigwire/core/common/bytes.hpp>
#include <sigwire/core/common/decoding_result.hpp>

namespace sigwire::endian {

//! \brief Transforms a uint64_t stored in memory with native endianness to its compacted big endian byte form
//! \return A ByteView into an internal static buffer (thread specific) of the function
//! \remarks each function call overwrites the buffer, therefore invalidating a previously returned result
//! \remarks A "compact" big endian form strips leftmost bytes valued to zero
ByteView to_big_compact(uint64_t value);

//! \brief Transforms a uint256 stored in memory with native endianness to its compacted big endian byte form
//! \remarks Same buffer lifetime rules as the uint64_t overload apply
ByteView to_big_compact(const intx::uint256& value);

//! \brief Parses unsigned integer from a compacted big endian byte form.
//! \param [in] data : input stream of bytes
//! \param [out] out : the parsed value
//! \return kOverflow if data is longer than T, kLeadingZero if data starts with a zero byte
template <UnsignedIntegral T>
DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());

    out = intx::to_big_endian(out);
    return {};
}

}  // namespace sigwire::endian
