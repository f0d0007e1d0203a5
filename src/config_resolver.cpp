#include "config_resolver.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

namespace rembed {

using json = nlohmann::json;

namespace {

bool is_provider_token(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isalnum(c) && c != '_' && c != '-') return false;
    }
    return true;
}

// "openai::text-embedding-3-small" → {"openai", "text-embedding-3-small"}.
// Only the first "::" separates; model names may contain ':'.
std::pair<std::string, std::string> split_qualified(const std::string& model) {
    auto sep = model.find("::");
    if (sep == std::string::npos) return {"", model};
    return {model.substr(0, sep), model.substr(sep + 2)};
}

uint64_t limit_for(const std::string& key) {
    if (key == "timeout_ms" || key == "request_timeout_ms") return kMaxRequestTimeoutMs;
    return UINT32_MAX;
}

uint64_t positive_or_throw(const std::string& key, const std::string& value) {
    uint64_t out = 0;
    if (!parse_positive(trim(value), out)) {
        throw ConfigError(ConfigErrorKind::MalformedInput,
                          "'" + key + "' must be a positive integer, got '" + value + "'");
    }
    if (out > limit_for(key)) {
        throw ConfigError(ConfigErrorKind::MalformedInput,
                          "'" + key + "' must be at most " + std::to_string(limit_for(key)) +
                          ", got '" + value + "'");
    }
    return out;
}

uint64_t positive_or_throw(const std::string& key, const json& value) {
    if (value.is_number_unsigned()) {
        return positive_or_throw(key, std::to_string(value.get<uint64_t>()));
    }
    if (value.is_string()) return positive_or_throw(key, value.get<std::string>());
    throw ConfigError(ConfigErrorKind::MalformedInput,
                      "'" + key + "' must be a positive integer");
}

} // namespace

ConfigResolver::ConfigResolver(PerformanceConfig defaults, CredentialLookup lookup)
    : defaults_(defaults), lookup_(std::move(lookup)) {}

ConfigResolver::ConfigResolver(const Config& config)
    : defaults_(config.performance)
    , lookup_([config](ProviderKind kind) {
          return config.api_key_for(provider_to_string(kind));
      }) {}

const std::vector<ConfigResolver::Grammar>& ConfigResolver::grammars() {
    static const std::vector<Grammar> kOrder = {
        &ConfigResolver::parse_options,
        &ConfigResolver::parse_compact,
        &ConfigResolver::parse_json,
    };
    return kOrder;
}

ClientDescriptor ConfigResolver::resolve(const std::string& name, const ConfigInput& input) const {
    for (auto grammar : grammars()) {
        if (auto draft = grammar(input)) {
            return finalize(name, std::move(*draft));
        }
    }
    std::string shown = std::holds_alternative<std::string>(input)
        ? "'" + std::get<std::string>(input) + "'"
        : std::string("options");
    throw ConfigError(ConfigErrorKind::MalformedInput,
                      "client '" + name + "': unrecognised configuration " + shown);
}

// ── Grammar 1: key/value options ────────────────────────────────

std::optional<ConfigResolver::Draft> ConfigResolver::parse_options(const ConfigInput& input) {
    const auto* options = std::get_if<ClientOptions>(&input);
    if (!options) return std::nullopt;

    Draft d;
    d.grammar = "options";
    std::optional<std::string> embedding_model;
    for (const auto& [raw_key, value] : *options) {
        std::string key = to_lower(trim(raw_key));
        if (key == "provider" || key == "format") d.provider = value;
        else if (key == "model") d.model = value;
        else if (key == "embedding_model") embedding_model = value;
        else if (key == "vision_model") d.vision_model = value;
        else if (key == "key" || key == "api_key") d.credential = value;
        else if (key == "url" || key == "base_url") d.endpoint = value;
        else if (key == "prompt") d.prompt = value;
        else if (key == "max_concurrency") d.max_concurrency = positive_or_throw(key, value);
        else if (key == "timeout_ms" || key == "request_timeout_ms")
            d.timeout_ms = positive_or_throw(key, value);
        else if (key == "batch_size" || key == "stream_batch_size")
            d.stream_batch_size = positive_or_throw(key, value);
        else {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                              "unknown client option '" + raw_key + "'");
        }
    }

    // With embedding_model given, "model" names the vision model.
    if (embedding_model) {
        if (d.vision_model && !d.model.empty()) {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                              "'model' and 'vision_model' both given alongside 'embedding_model'");
        }
        if (!d.vision_model && !d.model.empty()) d.vision_model = d.model;
        d.model = *embedding_model;
    }
    if (d.model.empty() && d.provider.empty()) {
        throw ConfigError(ConfigErrorKind::MalformedInput, "'model' or 'format' key is required");
    }
    return d;
}

// ── Grammar 2: compact strings ──────────────────────────────────

std::optional<ConfigResolver::Draft> ConfigResolver::parse_compact(const ConfigInput& input) {
    const auto* text = std::get_if<std::string>(&input);
    if (!text) return std::nullopt;
    std::string s = trim(*text);

    Draft d;
    d.grammar = "compact";

    auto dcolon = s.find("::");
    if (dcolon != std::string::npos) {
        std::string prefix = s.substr(0, dcolon);
        if (!is_provider_token(prefix)) return std::nullopt;
        d.provider = prefix;
        d.model = s.substr(dcolon + 2);
        if (d.model.empty()) {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                              "'" + s + "' names a provider but no model");
        }
        return d;
    }

    auto colon = s.find(':');
    if (colon != std::string::npos) {
        std::string prefix = s.substr(0, colon);
        if (!is_provider_token(prefix)) return std::nullopt;
        std::string key = s.substr(colon + 1);
        if (key.empty()) {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                              "'" + prefix + ":' is missing the credential");
        }
        d.provider = prefix;
        d.credential = key;
        return d;
    }

    if (!is_provider_token(s)) return std::nullopt;
    d.provider = s;
    return d;
}

// ── Grammar 3: JSON object ──────────────────────────────────────

std::optional<ConfigResolver::Draft> ConfigResolver::parse_json(const ConfigInput& input) {
    const auto* text = std::get_if<std::string>(&input);
    if (!text) return std::nullopt;
    std::string s = trim(*text);
    if (s.empty() || s.front() != '{') return std::nullopt;

    json j;
    try {
        j = json::parse(s);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigErrorKind::MalformedInput,
                          std::string("invalid JSON options: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError(ConfigErrorKind::MalformedInput, "JSON options must be an object");
    }

    auto str = [&](const char* key) -> std::optional<std::string> {
        if (!j.contains(key)) return std::nullopt;
        if (!j[key].is_string()) {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                              std::string("'") + key + "' must be a string");
        }
        return j[key].get<std::string>();
    };

    Draft d;
    d.grammar = "json";
    d.provider = str("provider").value_or("");
    d.model = str("model").value_or("");
    d.credential = str("key");
    if (!d.credential) d.credential = str("api_key");
    d.endpoint = str("base_url");
    if (!d.endpoint) d.endpoint = str("url");
    d.vision_model = str("vision_model");
    d.prompt = str("prompt");

    if (auto embedding_model = str("embedding_model")) {
        if (!d.vision_model && !d.model.empty()) d.vision_model = d.model;
        d.model = *embedding_model;
    }
    if (j.contains("max_concurrency"))
        d.max_concurrency = positive_or_throw("max_concurrency", j["max_concurrency"]);
    if (j.contains("request_timeout_ms"))
        d.timeout_ms = positive_or_throw("request_timeout_ms", j["request_timeout_ms"]);
    if (j.contains("stream_batch_size"))
        d.stream_batch_size = positive_or_throw("stream_batch_size", j["stream_batch_size"]);
    return d;
}

// ── Validation ──────────────────────────────────────────────────

std::optional<std::string> ConfigResolver::credential_for(
        ProviderKind kind, const std::optional<std::string>& given) const {
    if (given && !given->empty()) return given;
    if (lookup_) {
        std::string fallback = lookup_(kind);
        if (!fallback.empty()) return fallback;
    }
    const auto& traits = provider_traits(kind);
    if (traits.requires_credential) {
        throw ConfigError(ConfigErrorKind::MissingCredential,
            std::string("provider '") + traits.name + "' needs an API key; pass one in the "
            "client options or set " + traits.env_var);
    }
    return std::nullopt;
}

ClientDescriptor ConfigResolver::finalize(const std::string& name, Draft draft) const {
    auto [model_prefix, bare_model] = split_qualified(trim(draft.model));
    std::string provider_name = trim(draft.provider);

    if (!model_prefix.empty() && !provider_name.empty()) {
        auto a = provider_from_string(provider_name);
        auto b = provider_from_string(model_prefix);
        if (a && b && *a != *b) {
            throw ConfigError(ConfigErrorKind::MalformedInput,
                "provider '" + provider_name + "' conflicts with model prefix '" +
                model_prefix + "'");
        }
    }
    if (provider_name.empty()) provider_name = model_prefix;
    // Bare model names keep the historical OpenAI default
    if (provider_name.empty()) provider_name = "openai";

    auto kind = provider_from_string(provider_name);
    if (!kind) {
        throw ConfigError(ConfigErrorKind::UnknownProvider,
                          "'" + provider_name + "' is not a supported provider");
    }

    ClientDescriptor desc;
    desc.provider = *kind;
    desc.model = bare_model.empty() ? name : bare_model;
    if (desc.model.empty()) {
        throw ConfigError(ConfigErrorKind::MalformedInput, "model name must not be empty");
    }
    desc.credential = credential_for(*kind, draft.credential);
    if (draft.endpoint && !trim(*draft.endpoint).empty()) {
        desc.endpoint_override = trim(*draft.endpoint);
    }

    if (draft.vision_model) {
        auto [vprefix, vmodel] = split_qualified(trim(*draft.vision_model));
        if (vmodel.empty()) {
            throw ConfigError(ConfigErrorKind::MalformedInput, "vision model name must not be empty");
        }
        desc.vision_provider = *kind;
        if (!vprefix.empty()) {
            auto vkind = provider_from_string(vprefix);
            if (!vkind) {
                throw ConfigError(ConfigErrorKind::UnknownProvider,
                                  "'" + vprefix + "' is not a supported provider");
            }
            desc.vision_provider = *vkind;
        }
        desc.vision_model = vmodel;
        desc.vision_credential = desc.vision_provider == desc.provider
            ? desc.credential
            : credential_for(desc.vision_provider, std::nullopt);
    }
    if (draft.prompt && !draft.prompt->empty()) desc.vision_prompt = draft.prompt;

    desc.performance = defaults_;
    desc.performance.dedicated_admission = false;
    if (draft.max_concurrency) {
        desc.performance.max_concurrency = static_cast<uint32_t>(*draft.max_concurrency);
        desc.performance.dedicated_admission = true;
    }
    if (draft.timeout_ms) {
        desc.performance.request_timeout = std::chrono::milliseconds(*draft.timeout_ms);
    }
    if (draft.stream_batch_size) {
        desc.performance.stream_batch_size = static_cast<uint32_t>(*draft.stream_batch_size);
    }
    return desc;
}

} // namespace rembed
