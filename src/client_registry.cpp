#include "client_registry.hpp"
#include "errors.hpp"
#include <iostream>

namespace rembed {

static long timeout_seconds(const PerformanceConfig& perf) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(perf.request_timeout).count();
    return secs < 1 ? 1L : static_cast<long>(secs);
}

HandleFactory default_handle_factory(HttpClient& http, const Config& config) {
    return [&http, config](ProviderKind kind, const ProviderSettings& settings) {
        ProviderSettings effective = settings;
        if (effective.base_url.empty()) {
            effective.base_url = config.base_url_for(provider_to_string(kind));
        }
        return create_provider(kind, effective, http);
    };
}

ClientRegistry::ClientRegistry(HandleFactory factory, uint32_t shared_concurrency,
                               std::string system_prompt)
    : factory_(std::move(factory))
    , system_prompt_(std::move(system_prompt))
    , shared_admission_(std::make_shared<Semaphore>(shared_concurrency)) {}

std::shared_ptr<const RegisteredClient> ClientRegistry::register_client(
        const std::string& name, const ClientDescriptor& descriptor) {
    auto client = std::make_shared<RegisteredClient>();
    client->name = name;
    client->descriptor = descriptor;

    ProviderSettings settings;
    settings.api_key = descriptor.credential.value_or("");
    settings.base_url = descriptor.endpoint_override.value_or("");
    settings.timeout_seconds = timeout_seconds(descriptor.performance);
    settings.system_prompt = system_prompt_;
    client->embedder = factory_(descriptor.provider, settings);
    if (!client->embedder) {
        throw ProviderError(name, "connect", "no handle for provider " +
                            std::string(provider_to_string(descriptor.provider)));
    }

    if (descriptor.has_vision()) {
        if (descriptor.vision_provider == descriptor.provider) {
            client->vision = client->embedder;
        } else {
            ProviderSettings vision_settings = settings;
            vision_settings.api_key = descriptor.vision_credential.value_or("");
            // An endpoint override belongs to the embedding provider
            vision_settings.base_url.clear();
            client->vision = factory_(descriptor.vision_provider, vision_settings);
            if (!client->vision) {
                throw ProviderError(name, "connect", "no handle for vision provider " +
                                    std::string(provider_to_string(descriptor.vision_provider)));
            }
        }
    }

    client->admission = descriptor.performance.dedicated_admission
        ? std::make_shared<Semaphore>(descriptor.performance.max_concurrency)
        : shared_admission_;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it != clients_.end()) {
        std::cerr << "[registry] Replacing client '" << name << "' ("
                  << it->second->descriptor.qualified_model() << " -> "
                  << descriptor.qualified_model() << ")\n";
        it->second = client;
    } else {
        clients_.emplace(name, client);
    }
    return client;
}

std::shared_ptr<const RegisteredClient> ClientRegistry::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        throw ClientNotFound(name);
    }
    return it->second;
}

bool ClientRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(name) > 0;
}

std::vector<std::string> ClientRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(clients_.size());
    for (const auto& [name, _] : clients_) {
        out.push_back(name);
    }
    return out;
}

size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

} // namespace rembed
