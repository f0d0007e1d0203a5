#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace rembed {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

std::shared_ptr<EmbeddingProvider> PluginRegistry::create_provider(
        const std::string& name, const ProviderSettings& settings, HttpClient& http) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it == providers_.end()) {
            throw std::invalid_argument("No adapter registered for provider: " + name);
        }
        factory = it->second;
    }
    return std::shared_ptr<EmbeddingProvider>(factory(settings, http));
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

} // namespace rembed
