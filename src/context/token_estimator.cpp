#include "context/token_estimator.hpp"

#include <type_traits>
#include <variant>

namespace stride::context {

using protocol::ContentBlock;
using protocol::ImageBlock;
using protocol::Message;
using protocol::TextBlock;
using protocol::ToolResultBlock;
using protocol::ToolUseBlock;

namespace {

std::size_t block_chars(const ContentBlock& block) {
    return std::visit(
        [](const auto& b) -> std::size_t {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, TextBlock>) {
                return b.text.size();
            } else if constexpr (std::is_same_v<T, ImageBlock>) {
                // Images are billed per tile, not per base64 byte
                return 1024;
            } else if constexpr (std::is_same_v<T, ToolUseBlock>) {
                return b.id.size() + b.name.size() + b.input.dump().size();
            } else {
                return b.tool_use_id.size() + b.content.size();
            }
        },
        block);
}

}  // namespace

std::size_t TokenEstimator::estimate(const std::vector<Message>& messages) const {
    std::size_t total = 0;
    for (const auto& message : messages) {
        total += estimate(message);
    }
    return total;
}

std::size_t CharacterTokenEstimator::estimate(const Message& message) const {
    std::size_t chars = 0;
    if (const auto* text = std::get_if<std::string>(&message.content)) {
        chars = text->size();
    } else {
        for (const auto& block : std::get<std::vector<ContentBlock>>(message.content)) {
            chars += block_chars(block);
        }
    }
    return (chars + kCharsPerToken - 1) / kCharsPerToken + kMessageOverhead;
}

}  // namespace stride::context
