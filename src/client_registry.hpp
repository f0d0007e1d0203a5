#pragma once
#include "client.hpp"
#include "http.hpp"
#include "provider.hpp"
#include "semaphore.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rembed {

// A resolved client plus the handles built for it. Never mutated after
// registration; re-registration swaps in a new object.
struct RegisteredClient {
    std::string name;
    ClientDescriptor descriptor;
    std::shared_ptr<EmbeddingProvider> embedder;
    std::shared_ptr<EmbeddingProvider> vision;   // null without a vision model
    std::shared_ptr<Semaphore> admission;
};

// Builds a provider handle. Injectable so tests can avoid the network.
using HandleFactory = std::function<std::shared_ptr<EmbeddingProvider>(
    ProviderKind kind, const ProviderSettings& settings)>;

// Handles built through the plugin registry over the given HTTP client,
// with base URLs from config when the descriptor has none.
HandleFactory default_handle_factory(HttpClient& http, const Config& config);

class ClientRegistry {
public:
    ClientRegistry(HandleFactory factory, uint32_t shared_concurrency,
                   std::string system_prompt = {});

    // Builds handles outside the lock, then overwrites any previous entry
    std::shared_ptr<const RegisteredClient> register_client(const std::string& name,
                                                            const ClientDescriptor& descriptor);

    // Throws ClientNotFound
    std::shared_ptr<const RegisteredClient> lookup(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const;

    const std::shared_ptr<Semaphore>& shared_admission() const { return shared_admission_; }

private:
    HandleFactory factory_;
    std::string system_prompt_;
    std::shared_ptr<Semaphore> shared_admission_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const RegisteredClient>> clients_;
};

} // namespace rembed
