#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace rembed {

// Adapter for providers that expose the OpenAI request shapes:
// POST /embeddings for vectors and POST /chat/completions with an
// image_url content part for descriptions. Serves openai, gemini,
// cohere, anthropic, groq, deepseek, xai, mistral and voyage through
// their compatibility endpoints.
class OpenAICompatibleProvider : public EmbeddingProvider {
public:
    OpenAICompatibleProvider(std::string name, const ProviderSettings& settings,
                             HttpClient& http);

    Embedding embed(const std::string& model, const std::string& text) override;

    std::vector<Embedding> embed_batch(const std::string& model,
                                       const std::vector<std::string>& texts) override;

    std::string describe_image(const std::string& model,
                               const std::string& image,
                               const std::string& prompt) override;

    std::string provider_name() const override { return name_; }

    const std::string& base_url() const { return base_url_; }

private:
    std::vector<Header> build_headers() const;

    std::string name_;
    std::string api_key_;
    std::string base_url_;
    std::string system_prompt_;
    long timeout_seconds_;
    HttpClient& http_;
};

} // namespace rembed
