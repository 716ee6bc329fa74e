#include "protocol/message_contract.hpp"

#include <stdexcept>
#include <utility>

namespace stride::protocol {

using nlohmann::json;

Message Message::system(std::string text) {
    return Message{Role::System, std::move(text), std::nullopt};
}

Message Message::user(std::string text) {
    return Message{Role::User, std::move(text), std::nullopt};
}

Message Message::assistant(std::string text) {
    return Message{Role::Assistant, std::move(text), std::nullopt};
}

Message Message::assistant(std::vector<ContentBlock> blocks) {
    return Message{Role::Assistant, std::move(blocks), std::nullopt};
}

Message Message::tool(std::string text) {
    return Message{Role::Tool, std::move(text), std::nullopt};
}

Message Message::tool_result(std::string tool_use_id, std::string content,
                             const bool is_error) {
    std::vector<ContentBlock> blocks;
    blocks.emplace_back(ToolResultBlock{std::move(tool_use_id), is_error, std::move(content)});
    return Message{Role::Tool, std::move(blocks), std::nullopt};
}

std::optional<std::string> Message::text() const {
    if (const auto* plain = std::get_if<std::string>(&content)) {
        return *plain;
    }

    std::string joined;
    bool found = false;
    for (const auto& block : std::get<std::vector<ContentBlock>>(content)) {
        const auto* text_block = std::get_if<TextBlock>(&block);
        if (text_block == nullptr) {
            continue;
        }
        if (found) {
            joined += "\n";
        }
        joined += text_block->text;
        found = true;
    }
    if (!found) {
        return std::nullopt;
    }
    return joined;
}

bool Message::has_tool_use() const {
    const auto* blocks = std::get_if<std::vector<ContentBlock>>(&content);
    if (blocks == nullptr) {
        return false;
    }
    for (const auto& block : *blocks) {
        if (std::holds_alternative<ToolUseBlock>(block)) {
            return true;
        }
    }
    return false;
}

std::vector<ToolUseBlock> Message::tool_uses() const {
    std::vector<ToolUseBlock> uses;
    const auto* blocks = std::get_if<std::vector<ContentBlock>>(&content);
    if (blocks == nullptr) {
        return uses;
    }
    for (const auto& block : *blocks) {
        if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            uses.push_back(*use);
        }
    }
    return uses;
}

std::vector<std::string> Message::tool_result_ids() const {
    std::vector<std::string> ids;
    const auto* blocks = std::get_if<std::vector<ContentBlock>>(&content);
    if (blocks == nullptr) {
        return ids;
    }
    for (const auto& block : *blocks) {
        if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
            ids.push_back(result->tool_use_id);
        }
    }
    return ids;
}

bool operator==(const TextBlock& lhs, const TextBlock& rhs) {
    return lhs.text == rhs.text;
}

bool operator==(const ImageBlock& lhs, const ImageBlock& rhs) {
    return lhs.data == rhs.data && lhs.mime_type == rhs.mime_type;
}

bool operator==(const ToolUseBlock& lhs, const ToolUseBlock& rhs) {
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.input == rhs.input;
}

bool operator==(const ToolResultBlock& lhs, const ToolResultBlock& rhs) {
    return lhs.tool_use_id == rhs.tool_use_id && lhs.is_error == rhs.is_error &&
           lhs.content == rhs.content;
}

bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.role == rhs.role && lhs.content == rhs.content &&
           lhs.metadata == rhs.metadata;
}

bool operator!=(const Message& lhs, const Message& rhs) {
    return !(lhs == rhs);
}

std::string to_string(const Role role) {
    switch (role) {
        case Role::System:
            return "system";
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::Tool:
            return "tool";
        default:
            return "unknown";
    }
}

std::optional<Role> role_from_string(const std::string& value) {
    if (value == "system") {
        return Role::System;
    }
    if (value == "user") {
        return Role::User;
    }
    if (value == "assistant") {
        return Role::Assistant;
    }
    if (value == "tool") {
        return Role::Tool;
    }
    return std::nullopt;
}

void to_json(json& j, const ContentBlock& block) {
    if (const auto* text = std::get_if<TextBlock>(&block)) {
        j = json{{"type", "text"}, {"text", text->text}};
    } else if (const auto* image = std::get_if<ImageBlock>(&block)) {
        j = json{{"type", "image"}, {"data", image->data}, {"mime_type", image->mime_type}};
    } else if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
        j = json{{"type", "tool_use"}, {"id", use->id}, {"name", use->name},
                 {"input", use->input}};
    } else {
        const auto& result = std::get<ToolResultBlock>(block);
        j = json{{"type", "tool_result"},
                 {"tool_use_id", result.tool_use_id},
                 {"content", result.content}};
        j["is_error"] = result.is_error.has_value() ? json(result.is_error.value()) : json();
    }
}

void from_json(const json& j, ContentBlock& block) {
    const auto type = j.at("type").get<std::string>();
    if (type == "text") {
        block = TextBlock{j.at("text").get<std::string>()};
    } else if (type == "image") {
        block = ImageBlock{j.at("data").get<std::string>(),
                           j.at("mime_type").get<std::string>()};
    } else if (type == "tool_use") {
        ToolUseBlock use;
        use.id = j.at("id").get<std::string>();
        use.name = j.at("name").get<std::string>();
        use.input = j.value("input", json::object());
        block = std::move(use);
    } else if (type == "tool_result") {
        ToolResultBlock result;
        result.tool_use_id = j.at("tool_use_id").get<std::string>();
        result.content = j.at("content").get<std::string>();
        if (j.contains("is_error") && !j.at("is_error").is_null()) {
            result.is_error = j.at("is_error").get<bool>();
        }
        block = std::move(result);
    } else {
        throw std::invalid_argument("Unknown content block type: " + type);
    }
}

void to_json(json& j, const Message& message) {
    j = json::object();
    j["role"] = to_string(message.role);
    if (const auto* plain = std::get_if<std::string>(&message.content)) {
        j["content"] = *plain;
    } else {
        json blocks = json::array();
        for (const auto& block : std::get<std::vector<ContentBlock>>(message.content)) {
            json encoded;
            to_json(encoded, block);
            blocks.push_back(std::move(encoded));
        }
        j["content"] = std::move(blocks);
    }
    j["metadata"] = message.metadata.has_value() ? message.metadata.value() : json();
}

void from_json(const json& j, Message& message) {
    const auto role_text = j.at("role").get<std::string>();
    const auto role = role_from_string(role_text);
    if (!role.has_value()) {
        throw std::invalid_argument("Unknown message role: " + role_text);
    }
    message.role = role.value();

    const auto& content = j.at("content");
    if (content.is_string()) {
        message.content = content.get<std::string>();
    } else if (content.is_array()) {
        std::vector<ContentBlock> blocks;
        blocks.reserve(content.size());
        for (const auto& item : content) {
            ContentBlock block;
            from_json(item, block);
            blocks.push_back(std::move(block));
        }
        message.content = std::move(blocks);
    } else {
        throw std::invalid_argument("Message content must be a string or an array.");
    }

    message.metadata.reset();
    if (j.contains("metadata") && !j.at("metadata").is_null()) {
        message.metadata = j.at("metadata");
    }
}

}  // namespace stride::protocol
