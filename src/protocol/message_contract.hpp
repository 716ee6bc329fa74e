#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace stride::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    struct TextBlock {
        std::string text;
    };

    // Base64 payload plus its MIME type
    struct ImageBlock {
        std::string data;
        std::string mime_type;
    };

    // The model asking for a tool to run
    struct ToolUseBlock {
        std::string id;
        std::string name;
        nlohmann::json input = nlohmann::json::object();
    };

    // The answer to a ToolUseBlock, paired by tool_use_id
    struct ToolResultBlock {
        std::string tool_use_id;
        std::optional<bool> is_error;
        std::string content;
    };

    using ContentBlock = std::variant<TextBlock, ImageBlock, ToolUseBlock, ToolResultBlock>;

    // Either plain text or an ordered list of blocks
    using MessageContent = std::variant<std::string, std::vector<ContentBlock>>;

    struct Message {
        Role role = Role::User;
        MessageContent content = std::string();
        std::optional<nlohmann::json> metadata;

        static Message system(std::string text);
        static Message user(std::string text);
        static Message assistant(std::string text);
        static Message assistant(std::vector<ContentBlock> blocks);
        static Message tool(std::string text);
        static Message tool_result(std::string tool_use_id, std::string content,
                                   bool is_error);

        // Plain text, or all text blocks joined by '\n'; nullopt when there is none
        std::optional<std::string> text() const;

        bool has_tool_use() const;
        std::vector<ToolUseBlock> tool_uses() const;

        // Ids answered by the tool-result blocks of this message
        std::vector<std::string> tool_result_ids() const;
    };

    bool operator==(const TextBlock& lhs, const TextBlock& rhs);
    bool operator==(const ImageBlock& lhs, const ImageBlock& rhs);
    bool operator==(const ToolUseBlock& lhs, const ToolUseBlock& rhs);
    bool operator==(const ToolResultBlock& lhs, const ToolResultBlock& rhs);
    bool operator==(const Message& lhs, const Message& rhs);
    bool operator!=(const Message& lhs, const Message& rhs);

    std::string to_string(Role role);
    std::optional<Role> role_from_string(const std::string& value);

    // JSON shape: {"role": "assistant", "content": "..." | [{"type": "tool_use", ...}]}
    void to_json(nlohmann::json& j, const ContentBlock& block);
    void from_json(const nlohmann::json& j, ContentBlock& block);
    void to_json(nlohmann::json& j, const Message& message);
    void from_json(const nlohmann::json& j, Message& message);

} // namespace stride::protocol
