#include "ollama.hpp"
#include "http_json.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

static rembed::ProviderRegistrar reg_ollama("ollama",
    [](const rembed::ProviderSettings& settings, rembed::HttpClient& http) {
        return std::make_unique<rembed::OllamaProvider>(settings, http);
    });

using json = nlohmann::json;

namespace rembed {

OllamaProvider::OllamaProvider(const ProviderSettings& settings, HttpClient& http)
    : http_(http)
    , base_url_(settings.base_url.empty() ? "http://localhost:11434" : settings.base_url)
    , system_prompt_(settings.system_prompt)
    , timeout_seconds_(settings.timeout_seconds)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"}
};

Embedding OllamaProvider::embed(const std::string& model, const std::string& text) {
    json request = {
        {"model", model},
        {"input", text}
    };
    auto j = post_json(http_, "ollama", base_url_ + "/api/embed", request,
                       kJsonHeaders, timeout_seconds_);

    if (!j.contains("embeddings") || !j["embeddings"].is_array() || j["embeddings"].empty()) {
        throw ProviderError("ollama response: expected 'embeddings.0' path in response body");
    }
    return parse_float_array(j["embeddings"][0], "ollama", "embeddings.0");
}

std::vector<Embedding> OllamaProvider::embed_batch(const std::string& model,
                                                   const std::vector<std::string>& texts) {
    json request = {
        {"model", model},
        {"input", texts}
    };
    auto j = post_json(http_, "ollama", base_url_ + "/api/embed", request,
                       kJsonHeaders, timeout_seconds_);

    if (!j.contains("embeddings") || !j["embeddings"].is_array()) {
        throw ProviderError("ollama response: expected 'embeddings' array in response body");
    }
    const auto& embeddings = j["embeddings"];
    if (embeddings.size() != texts.size()) {
        throw ProviderError("ollama response: expected " + std::to_string(texts.size()) +
                            " embeddings, got " + std::to_string(embeddings.size()));
    }

    std::vector<Embedding> result;
    result.reserve(embeddings.size());
    for (const auto& e : embeddings) {
        result.push_back(parse_float_array(e, "ollama", "embeddings"));
    }
    return result;
}

std::string OllamaProvider::describe_image(const std::string& model,
                                           const std::string& image,
                                           const std::string& prompt) {
    json messages = json::array();
    if (!system_prompt_.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt_}});
    }
    messages.push_back({
        {"role", "user"},
        {"content", prompt},
        {"images", json::array({base64_encode(image)})}
    });

    json request = {
        {"model", model},
        {"stream", false},
        {"messages", messages}
    };
    auto j = post_json(http_, "ollama", base_url_ + "/api/chat", request,
                       kJsonHeaders, timeout_seconds_);

    if (!j.contains("message") || !j["message"].contains("content") ||
        !j["message"]["content"].is_string() ||
        j["message"]["content"].get<std::string>().empty()) {
        throw ProviderError("ollama response: no description generated");
    }
    return j["message"]["content"].get<std::string>();
}

} // namespace rembed
