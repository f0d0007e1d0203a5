#pragma once
#include "provider.hpp"
#include "http.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace rembed {

// Factory function type for provider adapters
using ProviderFactory = std::function<std::unique_ptr<EmbeddingProvider>(
    const ProviderSettings& settings, HttpClient& http)>;

// Central registry for self-registering provider adapters.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    std::shared_ptr<EmbeddingProvider> create_provider(const std::string& name,
                                                       const ProviderSettings& settings,
                                                       HttpClient& http) const;

    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// ── Self-registrar helper (used at file scope in each adapter .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

} // namespace rembed
