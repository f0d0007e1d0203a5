#include "mock.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <cstdio>
#include <limits>

static rembed::ProviderRegistrar reg_mock("mock",
    [](const rembed::ProviderSettings&, rembed::HttpClient&) {
        return std::make_unique<rembed::MockProvider>();
    });

namespace rembed {

static uint32_t simple_hash(const std::string& text) {
    uint32_t acc = 0;
    for (unsigned char b : text) {
        acc = acc * 31u + b;
    }
    return acc;
}

Embedding generate_mock_embedding(const std::string& text, uint32_t dimensions) {
    uint32_t hash = simple_hash(text);
    Embedding embedding;
    embedding.reserve(dimensions);
    for (uint32_t i = 0; i < dimensions; ++i) {
        float unit = static_cast<float>(hash + i) /
                     static_cast<float>(std::numeric_limits<uint32_t>::max());
        embedding.push_back(unit * 2.0f - 1.0f);
    }
    return embedding;
}

uint32_t MockProvider::dimensions_for(const std::string& model) {
    auto dash = model.rfind('-');
    if (dash == std::string::npos) return kDefaultDimensions;
    uint64_t dims = 0;
    if (!parse_positive(model.substr(dash + 1), dims) || dims > 65536) {
        return kDefaultDimensions;
    }
    return static_cast<uint32_t>(dims);
}

Embedding MockProvider::embed(const std::string& model, const std::string& text) {
    return generate_mock_embedding(text, dimensions_for(model));
}

std::vector<Embedding> MockProvider::embed_batch(const std::string& model,
                                                 const std::vector<std::string>& texts) {
    std::vector<Embedding> result;
    result.reserve(texts.size());
    for (const auto& text : texts) {
        result.push_back(embed(model, text));
    }
    return result;
}

std::string MockProvider::describe_image(const std::string& model,
                                         const std::string& image,
                                         const std::string& prompt) {
    if (image.empty()) {
        throw ProviderError("mock vision model " + model + " received an empty image");
    }
    char hash[16];
    std::snprintf(hash, sizeof(hash), "%08x", simple_hash(image));
    return prompt + " | " + detect_image_mime(image) + ", " +
           std::to_string(image.size()) + " bytes, hash " + hash;
}

} // namespace rembed
