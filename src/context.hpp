#pragma once
#include "client_registry.hpp"
#include "config.hpp"
#include "config_resolver.hpp"
#include "embedding_ops.hpp"
#include "http.hpp"
#include "multimodal.hpp"
#include "runtime.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rembed {

// Everything one host connection needs: configuration, the HTTP client,
// the client registry and the bridge onto the shared worker pool.
// Operations take client names and look them up per call.
class Context {
public:
    // Shared libcurl client and shared pool
    explicit Context(Config config);

    // Injected HTTP client and pool, for tests. Both must outlive the Context.
    Context(Config config, HttpClient& http, WorkerPool& pool);

    // Injected handle factory (no HTTP at all), for tests
    Context(Config config, HandleFactory factory, WorkerPool& pool);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Resolve and register; overwrites a previous client of the same name
    std::shared_ptr<const RegisteredClient> register_client(const std::string& name,
                                                            const ConfigInput& input);

    Embedding embed_one(const std::string& name, const std::string& text);
    std::vector<Embedding> embed_many(const std::string& name,
                                      const std::vector<std::string>& texts);
    Embedding embed_image(const std::string& name, const std::string& image,
                          const std::optional<std::string>& prompt = std::nullopt);
    PipelineOutcome process_multimodal(const std::string& name,
                                       std::vector<std::string> images,
                                       const std::optional<std::string>& prompt = std::nullopt,
                                       const ProgressCallback& progress = {});

    std::vector<std::string> client_names() const { return registry_.names(); }

    // Descriptor JSON without the credential. Throws ClientNotFound.
    nlohmann::json describe_client(const std::string& name) const;

    const Config& config() const { return config_; }
    ExecutionBridge& bridge() { return bridge_; }
    ClientRegistry& registry() { return registry_; }

private:
    Config config_;
    ConfigResolver resolver_;
    ClientRegistry registry_;
    ExecutionBridge bridge_;
    EmbeddingOperations ops_;
    MultimodalPipeline pipeline_;
};

} // namespace rembed
