// Copyright 2026 The Sigwire Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <array>
#include <sstream>
#include <string_view>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include <sigwire/core/types/address.hpp>

namespace sigwire {

std::ostream& operator<<(std::ostream& out, const ErrorContext& context) {
    out << "account=" << (context.account ? address_to_hex(*context.account) : "n/a");
    out << " nonce=";
    if (context.nonce) {
        out << *context.nonce;
    } else {
        out << "n/a";
    }
    out << " state=" << (context.last_state.empty() ? "n/a" : context.last_state);
    return out;
}

static std::string with_context(const std::string& message, const ErrorContext& context) {
    if (!context.account && !context.nonce && context.last_state.empty()) {
        return message;
    }
    std::ostringstream out;
    out << message << " [" << context << "]";
    return out.str();
}

Error::Error(const std::string& message, ErrorContext context)
    : std::runtime_error{with_context(message, context)}, message_{message}, context_{std::move(context)} {}

ChainRejection classify_rejection(std::string_view message) {
    // Wording used by geth, erigon, nethermind and besu txpools
    static constexpr std::array<std::pair<std::string_view, ChainRejection>, 12> kPatterns{{
        {"nonce too low", ChainRejection::kNonceTooLow},
        {"nonce is too low", ChainRejection::kNonceTooLow},
        {"oldnonce", ChainRejection::kNonceTooLow},
        {"insufficient funds", ChainRejection::kInsufficientFunds},
        {"insufficient balance", ChainRejection::kInsufficientFunds},
        {"underpriced", ChainRejection::kUnderpriced},
        {"fee cap less than block base fee", ChainRejection::kUnderpriced},
        {"max fee per gas less than block base fee", ChainRejection::kUnderpriced},
        {"already known", ChainRejection::kAlreadyKnown},
        {"already imported", ChainRejection::kAlreadyKnown},
        {"known transaction", ChainRejection::kAlreadyKnown},
        {"execution reverted", ChainRejection::kReverted},
    }};
    const std::string lowered{absl::AsciiStrToLower(message)};
    for (const auto& [pattern, reason] : kPatterns) {
        if (absl::StrContains(lowered, pattern)) {
            return reason;
        }
    }
    return ChainRejection::kOther;
}

}  // namespace sigwire
