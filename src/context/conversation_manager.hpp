#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "context/token_estimator.hpp"
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"

namespace stride::context {

// Escalating pressure; each level produces a smaller history than the last.
enum class CompressionLevel {
    Light,      // truncate older tool output and long texts
    Medium,     // fold older messages into a summary
    Heavy,
    Critical
};

struct CompressionPolicy {
    double trigger_ratio = 0.8;     // compress once history exceeds this share of the budget
    double target_ratio = 0.6;      // and aim to land below this share

    std::size_t medium_keep = 20;
    std::size_t heavy_keep = 10;
    std::size_t critical_keep = 4;

    // Light level: messages newer than this are never truncated
    std::size_t light_protected_tail = 6;
    std::size_t light_max_chars = 800;
};

struct CompressionSummary {
    CompressionLevel level = CompressionLevel::Light;
    std::size_t tokens_before = 0;
    std::size_t tokens_after = 0;
    std::size_t tokens_saved = 0;
    std::size_t messages_before = 0;
    std::size_t messages_after = 0;
    std::string summary;
};

struct MaybeCompressedResult {
    std::vector<protocol::Message> messages;
    std::optional<CompressionSummary> compression_applied;
};

// Keeps a conversation under its token budget. Stateless between calls; the
// engine owns the history and replaces it with whatever comes back.
class ConversationManager {
public:
    explicit ConversationManager(std::size_t token_budget,
                                 CompressionPolicy policy = {},
                                 std::shared_ptr<const TokenEstimator> estimator = nullptr);

    // When set, dropped messages are summarized by this model instead of by
    // a local digest. A failing summarizer fails the compression call.
    void set_summarizer(std::shared_ptr<model::ModelClient> summarizer);

    core::errors::Result<MaybeCompressedResult> maybe_compress(
        const std::vector<protocol::Message>& messages,
        const protocol::ExecutionContext* context = nullptr) const;

    bool should_compress(const std::vector<protocol::Message>& messages) const;
    std::size_t estimate_tokens(const std::vector<protocol::Message>& messages) const;

    std::size_t token_budget() const { return token_budget_; }
    const CompressionPolicy& policy() const { return policy_; }

    // Fallback that cannot fail: the leading System message (if any) plus the
    // most recent messages, never more than max_messages in total.
    static std::vector<protocol::Message> simple_trim(
        const std::vector<protocol::Message>& messages, std::size_t max_messages = 50);

private:
    struct Fold {
        std::vector<protocol::Message> head;
        std::vector<protocol::Message> dropped;
        std::vector<protocol::Message> tail;
    };

    std::vector<protocol::Message> truncate_older(
        const std::vector<protocol::Message>& messages, std::size_t* truncated) const;
    Fold fold(const std::vector<protocol::Message>& messages, std::size_t keep) const;
    std::size_t keep_for(CompressionLevel level) const;

    core::errors::Result<std::string> summarize(
        const std::vector<protocol::Message>& dropped,
        const protocol::ExecutionContext* context) const;

    std::size_t token_budget_;
    CompressionPolicy policy_;
    std::shared_ptr<const TokenEstimator> estimator_;
    std::shared_ptr<model::ModelClient> summarizer_;
};

std::string to_string(CompressionLevel level);

// Deterministic one-line-per-message digest of the given messages
std::string digest_messages(const std::vector<protocol::Message>& messages,
                            const protocol::ExecutionContext* context = nullptr);

}  // namespace stride::context
