#include "context/conversation_manager.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <sstream>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace stride::context {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ContentBlock;
using protocol::Message;
using protocol::Role;

namespace {

constexpr std::size_t kDigestLineChars = 120;
constexpr std::size_t kDigestMaxLines = 40;
const std::string kTruncationMarker = "... [truncated]";

std::string clip(const std::string& text, const std::size_t max_chars) {
    std::string line = text;
    std::replace(line.begin(), line.end(), '\n', ' ');
    if (line.size() <= max_chars) {
        return line;
    }
    return line.substr(0, max_chars) + "...";
}

bool truncate_text(std::string& text, const std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return false;
    }
    text = text.substr(0, max_chars) + kTruncationMarker;
    return true;
}

std::string describe_message(const Message& message) {
    std::string line = to_string(message.role) + ": ";
    if (message.has_tool_use()) {
        std::string names;
        for (const auto& use : message.tool_uses()) {
            names += (names.empty() ? "" : ", ") + use.name;
        }
        return line + "called " + names;
    }
    if (const auto* blocks = std::get_if<std::vector<ContentBlock>>(&message.content)) {
        for (const auto& block : *blocks) {
            if (const auto* result = std::get_if<protocol::ToolResultBlock>(&block)) {
                const bool failed = result->is_error.value_or(false);
                return line + (failed ? "error " : "result ") +
                       clip(result->content, kDigestLineChars);
            }
        }
    }
    return line + clip(message.text().value_or(""), kDigestLineChars);
}

}  // namespace

std::string to_string(const CompressionLevel level) {
    switch (level) {
        case CompressionLevel::Light:
            return "light";
        case CompressionLevel::Medium:
            return "medium";
        case CompressionLevel::Heavy:
            return "heavy";
        case CompressionLevel::Critical:
            return "critical";
        default:
            return "unknown";
    }
}

std::string digest_messages(const std::vector<Message>& messages,
                            const protocol::ExecutionContext* context) {
    std::ostringstream out;
    out << "Summary of " << messages.size() << " earlier messages";
    if (context != nullptr && !context->original_goal.empty()) {
        out << " (goal: " << clip(context->original_goal, kDigestLineChars) << ")";
    }
    out << ":";

    std::size_t shown = 0;
    for (const auto& message : messages) {
        if (shown == kDigestMaxLines) {
            out << "\n- ... " << (messages.size() - shown) << " more";
            break;
        }
        out << "\n- " << describe_message(message);
        ++shown;
    }
    return out.str();
}

ConversationManager::ConversationManager(const std::size_t token_budget,
                                         CompressionPolicy policy,
                                         std::shared_ptr<const TokenEstimator> estimator)
    : token_budget_(token_budget),
      policy_(policy),
      estimator_(estimator != nullptr ? std::move(estimator)
                                      : std::make_shared<CharacterTokenEstimator>()) {}

void ConversationManager::set_summarizer(std::shared_ptr<model::ModelClient> summarizer) {
    summarizer_ = std::move(summarizer);
}

std::size_t ConversationManager::estimate_tokens(const std::vector<Message>& messages) const {
    return estimator_->estimate(messages);
}

bool ConversationManager::should_compress(const std::vector<Message>& messages) const {
    const auto trigger = static_cast<double>(token_budget_) * policy_.trigger_ratio;
    return static_cast<double>(estimate_tokens(messages)) > trigger;
}

std::size_t ConversationManager::keep_for(const CompressionLevel level) const {
    switch (level) {
        case CompressionLevel::Medium:
            return policy_.medium_keep;
        case CompressionLevel::Heavy:
            return policy_.heavy_keep;
        case CompressionLevel::Critical:
            return policy_.critical_keep;
        default:
            return 0;
    }
}

std::vector<Message> ConversationManager::truncate_older(const std::vector<Message>& messages,
                                                         std::size_t* truncated) const {
    std::vector<Message> result = messages;
    const std::size_t protected_from =
        result.size() > policy_.light_protected_tail ? result.size() - policy_.light_protected_tail
                                                     : 0;
    std::size_t count = 0;
    for (std::size_t i = 0; i < protected_from; ++i) {
        auto& message = result[i];
        if (message.role == Role::System) {
            continue;
        }

        bool changed = false;
        if (auto* text = std::get_if<std::string>(&message.content)) {
            changed = truncate_text(*text, policy_.light_max_chars);
        } else {
            for (auto& block : std::get<std::vector<ContentBlock>>(message.content)) {
                if (auto* text_block = std::get_if<protocol::TextBlock>(&block)) {
                    changed = truncate_text(text_block->text, policy_.light_max_chars) || changed;
                } else if (auto* result_block = std::get_if<protocol::ToolResultBlock>(&block)) {
                    changed =
                        truncate_text(result_block->content, policy_.light_max_chars) || changed;
                }
            }
        }
        if (changed) {
            ++count;
        }
    }

    if (truncated != nullptr) {
        *truncated = count;
    }
    return result;
}

ConversationManager::Fold ConversationManager::fold(const std::vector<Message>& messages,
                                                    const std::size_t keep) const {
    Fold result;
    std::size_t body_start = 0;
    if (!messages.empty() && messages.front().role == Role::System) {
        result.head.push_back(messages.front());
        body_start = 1;
    }

    std::size_t tail_start =
        messages.size() > keep ? std::max(body_start, messages.size() - keep) : body_start;
    // A Tool result is only valid right after the Assistant turn that asked for it,
    // so the tail grows back to that turn unless nothing would be left to fold
    if (tail_start < messages.size() && messages[tail_start].role == Role::Tool) {
        std::size_t owner = tail_start;
        while (owner > body_start && messages[owner].role == Role::Tool) {
            --owner;
        }
        if (owner > body_start && messages[owner].role == Role::Assistant) {
            tail_start = owner;
        } else {
            while (tail_start < messages.size() && messages[tail_start].role == Role::Tool) {
                ++tail_start;
            }
        }
    }

    result.dropped.assign(messages.begin() + static_cast<std::ptrdiff_t>(body_start),
                          messages.begin() + static_cast<std::ptrdiff_t>(tail_start));
    result.tail.assign(messages.begin() + static_cast<std::ptrdiff_t>(tail_start),
                       messages.end());
    return result;
}

core::errors::Result<std::string> ConversationManager::summarize(
    const std::vector<Message>& dropped, const protocol::ExecutionContext* context) const {
    if (summarizer_ == nullptr) {
        return digest_messages(dropped, context);
    }

    const std::vector<Message> request = {
        Message::system("You condense the history of a coding agent. Keep decisions, file "
                        "paths, tool outcomes and open problems. Reply with the summary only."),
        Message::user(digest_messages(dropped, context))};
    model::ChatOptions options;
    options.max_tokens = 1024;

    core::errors::Result<model::ModelResponse> response = AgentError{
        ErrorCategory::Internal, "Summarizer did not run", "summarizer_failed"};
    try {
        response = summarizer_->complete(request, {}, options);
    } catch (const std::exception& ex) {
        return AgentError{ErrorCategory::Internal,
                          std::string("Summarizer threw: ") + ex.what(), "summarizer_failed"};
    }
    if (core::errors::is_error(response)) {
        const auto& err = core::errors::get_error(response);
        return AgentError{err.category, "Summarization failed: " + err.message, err.code};
    }

    auto text = core::errors::get_value(response).message.text();
    if (!text.has_value() || text->empty()) {
        return AgentError{ErrorCategory::Execution, "Summarizer returned no text",
                          "empty_summary"};
    }
    return *text;
}

core::errors::Result<MaybeCompressedResult> ConversationManager::maybe_compress(
    const std::vector<Message>& messages, const protocol::ExecutionContext* context) const {
    const std::size_t tokens_before = estimate_tokens(messages);
    if (!should_compress(messages)) {
        return MaybeCompressedResult{messages, std::nullopt};
    }

    const auto target = static_cast<double>(token_budget_) * policy_.target_ratio;
    std::size_t truncated = 0;
    const auto light = truncate_older(messages, &truncated);

    constexpr std::array<CompressionLevel, 4> kLevels = {
        CompressionLevel::Light, CompressionLevel::Medium, CompressionLevel::Heavy,
        CompressionLevel::Critical};
    CompressionLevel chosen = CompressionLevel::Critical;
    for (const auto level : kLevels) {
        std::size_t projected = 0;
        if (level == CompressionLevel::Light) {
            projected = estimate_tokens(light);
        } else {
            const auto candidate = fold(light, keep_for(level));
            projected = estimate_tokens(candidate.head) + estimate_tokens(candidate.tail);
            if (!candidate.dropped.empty()) {
                projected += estimator_->estimate(
                    Message::user(digest_messages(candidate.dropped, context)));
            }
        }
        if (static_cast<double>(projected) < target) {
            chosen = level;
            break;
        }
    }

    CompressionSummary summary;
    summary.level = chosen;
    summary.tokens_before = tokens_before;
    summary.messages_before = messages.size();

    std::vector<Message> result;
    if (chosen == CompressionLevel::Light) {
        result = light;
        summary.summary = "Truncated " + std::to_string(truncated) + " older messages";
    } else {
        auto folded = fold(light, keep_for(chosen));
        result = std::move(folded.head);
        if (!folded.dropped.empty()) {
            auto text = summarize(folded.dropped, context);
            if (core::errors::is_error(text)) {
                return core::errors::get_error(text);
            }
            summary.summary = core::errors::take_value(std::move(text));

            auto summary_message = Message::user("[Conversation summary]\n" + summary.summary);
            summary_message.metadata =
                nlohmann::json{{"compression_level", to_string(chosen)},
                               {"messages_folded", folded.dropped.size()}};
            result.push_back(std::move(summary_message));
        } else {
            summary.summary = "Nothing left to fold";
        }
        result.insert(result.end(), std::make_move_iterator(folded.tail.begin()),
                      std::make_move_iterator(folded.tail.end()));
    }

    summary.tokens_after = estimate_tokens(result);
    summary.tokens_saved =
        tokens_before > summary.tokens_after ? tokens_before - summary.tokens_after : 0;
    summary.messages_after = result.size();

    STRIDE_LOG_DEBUG("ConversationManager: " + to_string(chosen) + " compression " +
                     std::to_string(tokens_before) + " -> " +
                     std::to_string(summary.tokens_after) + " tokens");
    return MaybeCompressedResult{std::move(result), std::move(summary)};
}

std::vector<Message> ConversationManager::simple_trim(const std::vector<Message>& messages,
                                                      const std::size_t max_messages) {
    if (messages.size() <= max_messages) {
        return messages;
    }

    std::vector<Message> result;
    std::size_t budget = max_messages;
    if (!messages.empty() && messages.front().role == Role::System && max_messages > 0) {
        result.push_back(messages.front());
        --budget;
    }

    std::size_t start = messages.size() - budget;
    if (start < result.size()) {
        start = result.size();
    }
    while (start < messages.size() && messages[start].role == Role::Tool) {
        ++start;
    }
    result.insert(result.end(), messages.begin() + static_cast<std::ptrdiff_t>(start),
                  messages.end());
    return result;
}

}  // namespace stride::context
