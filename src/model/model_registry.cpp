#include "model/model_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "model/scripted_model_client.hpp"

namespace stride::model {

using core::errors::AgentError;
using core::errors::ErrorCategory;

void ModelRegistry::register_provider(const std::string& name, ModelFactory factory,
                                      const bool requires_credential) {
    providers_[name] = ProviderEntry{std::move(factory), requires_credential};
}

bool ModelRegistry::has_provider(const std::string& name) const {
    return providers_.find(name) != providers_.end();
}

std::vector<std::string> ModelRegistry::providers() const {
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& entry : providers_) {
        names.push_back(entry.first);
    }
    return names;
}

core::errors::Result<std::shared_ptr<ModelClient>> ModelRegistry::create(
    const ModelSettings& settings) const {
    auto it = providers_.find(settings.provider);
    if (it == providers_.end()) {
        std::string known;
        for (const auto& name : providers()) {
            known += (known.empty() ? "" : ", ") + name;
        }
        return AgentError{ErrorCategory::Setup,
                          "Unsupported model provider: " + settings.provider,
                          "unsupported_provider", "Known providers: " + known};
    }

    if (it->second.requires_credential && settings.api_key.empty()) {
        return AgentError{ErrorCategory::Setup,
                          "Provider " + settings.provider + " requires an API key.",
                          "missing_credential"};
    }

    try {
        auto created = it->second.factory(settings);
        if (!core::errors::is_error(created)) {
            STRIDE_LOG_DEBUG("ModelRegistry: created " + settings.provider + " client for model " +
                             core::errors::get_value(created)->model_name());
        }
        return created;
    } catch (const std::exception& e) {
        STRIDE_LOG_ERROR("ModelRegistry: factory for " + settings.provider + " threw: " + e.what());
        return AgentError{ErrorCategory::Internal,
                          "Model factory failed for provider " + settings.provider + ": " +
                              e.what(),
                          "model_factory_failed"};
    }
}

ModelRegistry ModelRegistry::with_builtin_providers() {
    ModelRegistry registry;
    registry.register_provider(
        "scripted",
        [](const ModelSettings& settings)
            -> core::errors::Result<std::shared_ptr<ModelClient>> {
            if (!settings.extra.contains("script")) {
                return AgentError{ErrorCategory::Setup,
                                  "The scripted provider needs a 'script' path.",
                                  "missing_script",
                                  "Pass --script <responses.json>."};
            }
            auto loaded = ScriptedModelClient::from_file(
                settings.extra.at("script").get<std::string>());
            if (core::errors::is_error(loaded)) {
                return core::errors::get_error(loaded);
            }
            return std::shared_ptr<ModelClient>(core::errors::get_value(loaded));
        },
        false);
    return registry;
}

}  // namespace stride::model
