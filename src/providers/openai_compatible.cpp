#include "openai_compatible.hpp"
#include "http_json.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

static rembed::ProviderFactory compatible_factory(const char* name) {
    return [name](const rembed::ProviderSettings& settings, rembed::HttpClient& http) {
        return std::make_unique<rembed::OpenAICompatibleProvider>(name, settings, http);
    };
}

static rembed::ProviderRegistrar reg_openai("openai", compatible_factory("openai"));
static rembed::ProviderRegistrar reg_gemini("gemini", compatible_factory("gemini"));
static rembed::ProviderRegistrar reg_cohere("cohere", compatible_factory("cohere"));
static rembed::ProviderRegistrar reg_anthropic("anthropic", compatible_factory("anthropic"));
static rembed::ProviderRegistrar reg_groq("groq", compatible_factory("groq"));
static rembed::ProviderRegistrar reg_deepseek("deepseek", compatible_factory("deepseek"));
static rembed::ProviderRegistrar reg_xai("xai", compatible_factory("xai"));
static rembed::ProviderRegistrar reg_mistral("mistral", compatible_factory("mistral"));
static rembed::ProviderRegistrar reg_voyage("voyage", compatible_factory("voyage"));

using json = nlohmann::json;

namespace rembed {

static std::string default_base_url(const std::string& name) {
    auto kind = provider_from_string(name);
    return kind ? provider_traits(*kind).default_base_url : std::string();
}

OpenAICompatibleProvider::OpenAICompatibleProvider(std::string name,
                                                   const ProviderSettings& settings,
                                                   HttpClient& http)
    : name_(std::move(name))
    , api_key_(settings.api_key)
    , base_url_(settings.base_url.empty() ? default_base_url(name_) : settings.base_url)
    , system_prompt_(settings.system_prompt)
    , timeout_seconds_(settings.timeout_seconds)
    , http_(http)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::vector<Header> OpenAICompatibleProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }
    return headers;
}

Embedding OpenAICompatibleProvider::embed(const std::string& model, const std::string& text) {
    json request = {
        {"model", model},
        {"input", text}
    };
    auto j = post_json(http_, name_, base_url_ + "/embeddings", request,
                       build_headers(), timeout_seconds_);

    if (!j.contains("data") || !j["data"].is_array() || j["data"].empty()) {
        throw ProviderError(name_ + " response: expected 'data.0' path in response body");
    }
    const auto& first = j["data"][0];
    if (!first.contains("embedding")) {
        throw ProviderError(name_ + " response: expected 'data.0.embedding' path in response body");
    }
    return parse_float_array(first["embedding"], name_, "data.0.embedding");
}

std::vector<Embedding> OpenAICompatibleProvider::embed_batch(
        const std::string& model, const std::vector<std::string>& texts) {
    json request = {
        {"model", model},
        {"input", texts}
    };
    auto j = post_json(http_, name_, base_url_ + "/embeddings", request,
                       build_headers(), timeout_seconds_);

    if (!j.contains("data") || !j["data"].is_array()) {
        throw ProviderError(name_ + " response: expected 'data' array in response body");
    }
    const auto& data = j["data"];
    if (data.size() != texts.size()) {
        throw ProviderError(name_ + " response: expected " + std::to_string(texts.size()) +
                            " embeddings, got " + std::to_string(data.size()));
    }

    // Entries carry their input position in "index"; do not trust array order.
    std::vector<Embedding> result(texts.size());
    std::vector<bool> filled(texts.size(), false);
    for (size_t pos = 0; pos < data.size(); ++pos) {
        const auto& item = data[pos];
        size_t index = pos;
        if (item.contains("index") && item["index"].is_number_unsigned()) {
            index = item["index"].get<size_t>();
        }
        if (index >= result.size() || filled[index]) {
            throw ProviderError(name_ + " response: invalid or duplicate embedding index " +
                                std::to_string(index));
        }
        if (!item.contains("embedding")) {
            throw ProviderError(name_ + " response: missing 'embedding' in data entry");
        }
        result[index] = parse_float_array(item["embedding"], name_, "data.embedding");
        filled[index] = true;
    }
    return result;
}

std::string OpenAICompatibleProvider::describe_image(const std::string& model,
                                                     const std::string& image,
                                                     const std::string& prompt) {
    json messages = json::array();
    if (!system_prompt_.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt_}});
    }
    std::string data_url = "data:" + detect_image_mime(image) + ";base64," + base64_encode(image);
    messages.push_back({
        {"role", "user"},
        {"content", json::array({
            {{"type", "text"}, {"text", prompt}},
            {{"type", "image_url"}, {"image_url", {{"url", data_url}}}}
        })}
    });

    json request = {
        {"model", model},
        {"messages", messages}
    };
    auto j = post_json(http_, name_, base_url_ + "/chat/completions", request,
                       build_headers(), timeout_seconds_);

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw ProviderError(name_ + " response: no choices in vision response");
    }
    const auto& message = j["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string() ||
        message["content"].get<std::string>().empty()) {
        throw ProviderError(name_ + " response: no description generated");
    }
    return message["content"].get<std::string>();
}

} // namespace rembed
