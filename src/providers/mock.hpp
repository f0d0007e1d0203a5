#pragma once
#include "../provider.hpp"
#include <cstdint>
#include <string>

namespace rembed {

// Offline provider for CI and local experiments. Embeddings are a pure
// function of the input text; descriptions are a pure function of the
// image bytes and prompt. An empty image is rejected so that failure
// paths can be exercised without a network.
class MockProvider : public EmbeddingProvider {
public:
    static constexpr uint32_t kDefaultDimensions = 384;

    Embedding embed(const std::string& model, const std::string& text) override;

    std::vector<Embedding> embed_batch(const std::string& model,
                                       const std::vector<std::string>& texts) override;

    std::string describe_image(const std::string& model,
                               const std::string& image,
                               const std::string& prompt) override;

    std::string provider_name() const override { return "mock"; }

    // "mock-embed-64" → 64; anything without a numeric suffix → default
    static uint32_t dimensions_for(const std::string& model);
};

// Deterministic pseudo-embedding of text
Embedding generate_mock_embedding(const std::string& text, uint32_t dimensions);

} // namespace rembed
