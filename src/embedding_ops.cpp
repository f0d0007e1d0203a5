#include "embedding_ops.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

namespace rembed {

// Adapters report provider-level failures without knowing the client
// name; attach it along with the stage.
template <typename F>
static auto with_stage(const std::string& client, const char* stage, F call)
        -> decltype(call()) {
    try {
        return call();
    } catch (const ProviderError& e) {
        throw ProviderError(client, stage, e.detail());
    } catch (const nlohmann::json::exception& e) {
        throw ProviderError(client, stage, e.what());
    }
}

Embedding describe_then_embed(const RegisteredClient& client,
                              const std::string& image,
                              const std::string& prompt) {
    if (!client.vision || !client.descriptor.vision_model) {
        throw UnsupportedOperation(client.name, "image embeddings (no vision_model configured)");
    }
    const auto& vision_model = *client.descriptor.vision_model;
    std::string description = with_stage(client.name, "describe", [&] {
        return client.vision->describe_image(vision_model, image, prompt);
    });
    return with_stage(client.name, "embed", [&] {
        return client.embedder->embed(client.descriptor.model, description);
    });
}

EmbeddingOperations::EmbeddingOperations(ExecutionBridge& bridge, std::string default_prompt)
    : bridge_(bridge), default_prompt_(std::move(default_prompt)) {}

std::string EmbeddingOperations::prompt_for(const RegisteredClient& client,
                                            const std::optional<std::string>& prompt) const {
    if (prompt && !prompt->empty()) return *prompt;
    if (client.descriptor.vision_prompt) return *client.descriptor.vision_prompt;
    return default_prompt_;
}

Embedding EmbeddingOperations::embed_one(const ClientHandle& client, const std::string& text) {
    return bridge_.run_blocking([client, text] {
        return with_stage(client->name, "embed", [&] {
            return client->embedder->embed(client->descriptor.model, text);
        });
    });
}

std::vector<Embedding> EmbeddingOperations::embed_many(const ClientHandle& client,
                                                       const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    return bridge_.run_blocking([client, texts] {
        return with_stage(client->name, "embed", [&] {
            auto result = client->embedder->embed_batch(client->descriptor.model, texts);
            if (result.size() != texts.size()) {
                throw ProviderError("expected " + std::to_string(texts.size()) +
                                    " embeddings, got " + std::to_string(result.size()));
            }
            return result;
        });
    });
}

Embedding EmbeddingOperations::embed_image(const ClientHandle& client,
                                           const std::string& image,
                                           const std::optional<std::string>& prompt) {
    if (!client->descriptor.has_vision()) {
        throw UnsupportedOperation(client->name, "image embeddings (no vision_model configured)");
    }
    std::string effective = prompt_for(*client, prompt);
    return bridge_.run_blocking([client, image, effective] {
        return describe_then_embed(*client, image, effective);
    });
}

} // namespace rembed
