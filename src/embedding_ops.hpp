#pragma once
#include "client_registry.hpp"
#include "runtime.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rembed {

using ClientHandle = std::shared_ptr<const RegisteredClient>;

// Describe an image with the client's vision model, then embed the
// description. Runs on the calling thread. Throws ProviderError whose
// stage() is "describe" or "embed".
Embedding describe_then_embed(const RegisteredClient& client,
                              const std::string& image,
                              const std::string& prompt);

// Text and single-image operations. Every provider call runs on the
// bridge's pool; the caller blocks for the result.
class EmbeddingOperations {
public:
    EmbeddingOperations(ExecutionBridge& bridge, std::string default_prompt);

    Embedding embed_one(const ClientHandle& client, const std::string& text);

    // One batched request. Same length and order as texts.
    std::vector<Embedding> embed_many(const ClientHandle& client,
                                      const std::vector<std::string>& texts);

    // Throws UnsupportedOperation when the client has no vision model
    Embedding embed_image(const ClientHandle& client,
                          const std::string& image,
                          const std::optional<std::string>& prompt = std::nullopt);

    // Per-call prompt, else the client's, else the configured default
    std::string prompt_for(const RegisteredClient& client,
                           const std::optional<std::string>& prompt) const;

private:
    ExecutionBridge& bridge_;
    std::string default_prompt_;
};

} // namespace rembed
