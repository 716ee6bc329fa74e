#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"

namespace stride::model {

// Provider selection. The api key is passed through untouched.
struct ModelSettings {
    std::string provider;
    std::string model;
    std::string api_key;
    std::optional<std::string> base_url;
    std::optional<std::uint32_t> max_tokens;
    nlohmann::json extra = nlohmann::json::object();   // provider specific knobs
};

using ModelFactory = std::function<core::errors::Result<std::shared_ptr<ModelClient>>(
    const ModelSettings&)>;

class ModelRegistry {
public:
    void register_provider(const std::string& name, ModelFactory factory,
                           bool requires_credential);

    bool has_provider(const std::string& name) const;
    std::vector<std::string> providers() const;

    core::errors::Result<std::shared_ptr<ModelClient>> create(
        const ModelSettings& settings) const;

    // Registry preloaded with the providers shipped in this repository
    static ModelRegistry with_builtin_providers();

private:
    struct ProviderEntry {
        ModelFactory factory;
        bool requires_credential = false;
    };

    std::map<std::string, ProviderEntry> providers_;
};

}  // namespace stride::model
