#include "config.hpp"
#include "provider.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace rembed {

nlohmann::json Config::defaults_json() {
    VisionConfig vision;
    nlohmann::json providers = nlohmann::json::object();
    for (const auto& t : all_provider_traits()) {
        if (t.kind == ProviderKind::Mock) continue;
        providers[t.name] = {{"api_key", ""}, {"base_url", ""}};
    }
    return {
        {"runtime", {
            {"worker_threads", 16}
        }},
        {"performance", {
            {"max_concurrency", 4},
            {"request_timeout_ms", 30000},
            {"stream_batch_size", 10}
        }},
        {"vision", {
            {"prompt", vision.prompt},
            {"system_prompt", vision.system_prompt}
        }},
        {"providers", providers}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Positive integers up to `limit` only; zero would disable workers or
// admission. Out-of-range values keep the default.
static void read_positive(const nlohmann::json& obj, const char* key, uint32_t& out,
                          uint64_t limit = UINT32_MAX) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    auto v = obj[key].get<uint64_t>();
    if (v == 0 || v > limit) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << v << "\n";
        return;
    }
    out = static_cast<uint32_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("runtime") && j["runtime"].is_object()) {
        read_positive(j["runtime"], "worker_threads", cfg.runtime.worker_threads);
    }

    if (j.contains("performance") && j["performance"].is_object()) {
        auto& p = j["performance"];
        read_positive(p, "max_concurrency", cfg.performance.max_concurrency);
        uint32_t timeout_ms = static_cast<uint32_t>(cfg.performance.request_timeout.count());
        read_positive(p, "request_timeout_ms", timeout_ms, kMaxRequestTimeoutMs);
        cfg.performance.request_timeout = std::chrono::milliseconds(timeout_ms);
        read_positive(p, "stream_batch_size", cfg.performance.stream_batch_size);
    }

    if (j.contains("vision") && j["vision"].is_object()) {
        auto& v = j["vision"];
        if (v.contains("prompt") && v["prompt"].is_string())
            cfg.vision.prompt = v["prompt"].get<std::string>();
        if (v.contains("system_prompt") && v["system_prompt"].is_string())
            cfg.vision.system_prompt = v["system_prompt"].get<std::string>();
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    return cfg;
}

Config Config::load_from(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return from_json(defaults_json());
    }
    try {
        nlohmann::json original = nlohmann::json::parse(file);
        return from_json(merge_defaults(original, defaults_json()));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Ignoring malformed config " << path << ": " << e.what() << "\n";
        return from_json(defaults_json());
    }
}

Config Config::load() {
    std::string path;
    if (const char* v = std::getenv("REMBED_CONFIG")) {
        path = v;
    } else {
        path = expand_home("~/.rembed/config.json");
    }
    Config cfg = load_from(path);
    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    // Environment variables always override the config file
    for (const auto& t : all_provider_traits()) {
        if (!t.env_var) continue;
        if (const char* v = std::getenv(t.env_var)) {
            if (*v) providers[t.name].api_key = v;
        }
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (*v) providers["ollama"].base_url = v;
    }
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace rembed
