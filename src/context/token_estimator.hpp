#pragma once

#include <cstddef>
#include <vector>
#include "protocol/message_contract.hpp"

namespace stride::context {

// Rough token cost of a conversation. Exact counts need the provider's
// tokenizer; the conversation manager only needs a consistent estimate.
class TokenEstimator {
public:
    virtual ~TokenEstimator() = default;

    virtual std::size_t estimate(const protocol::Message& message) const = 0;

    std::size_t estimate(const std::vector<protocol::Message>& messages) const;
};

// One token per four characters of text or serialized JSON, plus a fixed
// overhead per message for role and framing.
class CharacterTokenEstimator : public TokenEstimator {
public:
    static constexpr std::size_t kCharsPerToken = 4;
    static constexpr std::size_t kMessageOverhead = 4;

    using TokenEstimator::estimate;
    std::size_t estimate(const protocol::Message& message) const override;
};

}  // namespace stride::context
