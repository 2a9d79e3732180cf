#include "adapter_registry.hpp"
#include "anthropic_adapter.hpp"
#include "google_adapter.hpp"
#include "openai_adapter.hpp"
#include "../errors.hpp"
#include "../utils.hpp"

namespace polygate {

template <typename T>
static AdapterFactory factory_for() {
    return [](const ProviderConfig& cfg) -> std::unique_ptr<ProviderAdapter> {
        return std::make_unique<T>(cfg);
    };
}

AdapterRegistry AdapterRegistry::with_builtin_adapters() {
    AdapterRegistry reg;
    reg.register_adapter("anthropic", factory_for<AnthropicAdapter>(), {"claude"});
    reg.register_adapter("openai", factory_for<OpenAIAdapter>());
    reg.register_adapter("google", factory_for<GoogleAdapter>(), {"gemini"});
    reg.register_adapter("deepseek", factory_for<DeepSeekAdapter>());
    reg.register_adapter("qwen", factory_for<QwenAdapter>(), {"alibaba", "dashscope"});
    reg.register_adapter("glm", factory_for<GlmAdapter>(), {"zai", "zhipu"});
    reg.register_adapter("openai-compatible", factory_for<OpenAICompatibleAdapter>(),
                         {"local", "lmstudio", "ollama-openai", "vllm"});
    return reg;
}

void AdapterRegistry::register_adapter(const std::string& id, AdapterFactory factory,
                                       const std::vector<std::string>& aliases) {
    std::string key = to_lower(id);
    factories_[key] = std::move(factory);
    for (auto& alias : aliases) aliases_[to_lower(alias)] = key;
}

bool AdapterRegistry::knows(const std::string& id) const {
    std::string key = to_lower(id);
    return factories_.count(key) || aliases_.count(key);
}

std::unique_ptr<ProviderAdapter> AdapterRegistry::create(const std::string& id, const ProviderConfig& cfg) const {
    std::string key = to_lower(id);
    auto alias = aliases_.find(key);
    if (alias != aliases_.end()) key = alias->second;
    auto it = factories_.find(key);
    if (it == factories_.end()) {
        std::string known;
        for (auto& [k, _] : factories_) known += (known.empty() ? "" : ", ") + k;
        throw ConfigurationError("Unknown provider '" + id + "' (known: " + known + ")");
    }
    return it->second(cfg);
}

std::vector<std::string> AdapterRegistry::identifiers() const {
    std::vector<std::string> ids;
    for (auto& [k, _] : factories_) ids.push_back(k);
    return ids;
}

} // namespace polygate
