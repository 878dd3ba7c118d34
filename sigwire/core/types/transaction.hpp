// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <sigwire/core/common/base.hpp>
#include <sigwire/core/common/bytes.hpp>
#include <sigwire/core/common/decoding_result.hpp>

namespace sigwire {

// EIP-2718 transaction type
// Only the envelopes this service ever produces are supported
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kDynamicFee = 2,  // EIP-1559
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kDynamicFee};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // EIP-1559
    intx::uint256 max_fee_per_gas{0};           // gas price for legacy transactions
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    //! \brief Serialized payload whose keccak256 is signed
    //! \see Yellow Paper, Appendix F "Signing Transactions", EIP-155 and EIP-2718
    void encode_for_signing(Bytes& into) const;

    //! \brief The digest to be signed, i.e. keccak256 of encode_for_signing output
    evmc::bytes32 signing_hash() const;

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

class Transaction : public UnsignedTransaction {
  public:
    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};  // signature

    intx::uint256 v() const;  // EIP-155

    //! \brief Sets odd_y_parity and chain_id from an EIP-155 v
    //! \return false if v is not a valid EIP-155 value
    [[nodiscard]] bool set_v(const intx::uint256& v);

    //! \brief Recovers the address of the signer, nullopt if the signature is not valid
    std::optional<evmc::address> recover_sender() const;

    //! \brief Canonical network encoding, typed transactions are not wrapped into an RLP string
    void encode(Bytes& into) const;

    //! \brief keccak256 of the canonical encoding
    evmc::bytes32 hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {
    //! \brief Decodes a transaction in its network form, i.e. with typed transactions not wrapped into an RLP string
    DecodingResult decode_transaction(ByteView& from, Transaction& to) noexcept;
}  // namespace rlp

}  // namespace sigwire
