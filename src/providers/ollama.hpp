#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace rembed {

// Ollama native API: /api/embed for vectors, /api/chat with an images
// array for descriptions. No credential.
class OllamaProvider : public EmbeddingProvider {
public:
    OllamaProvider(const ProviderSettings& settings, HttpClient& http);

    Embedding embed(const std::string& model, const std::string& text) override;

    std::vector<Embedding> embed_batch(const std::string& model,
                                       const std::vector<std::string>& texts) override;

    std::string describe_image(const std::string& model,
                               const std::string& image,
                               const std::string& prompt) override;

    std::string provider_name() const override { return "ollama"; }

private:
    HttpClient& http_;
    std::string base_url_;
    std::string system_prompt_;
    long timeout_seconds_;
};

} // namespace rembed
