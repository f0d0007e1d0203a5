#pragma once
#include <string>
#include <cstdint>
#include <chrono>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace rembed {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct RuntimeConfig {
    uint32_t worker_threads = 16;  // size of the shared pool, fixed at first use
};

// Longest accepted request timeout (one day)
constexpr uint64_t kMaxRequestTimeoutMs = 24ULL * 60 * 60 * 1000;

struct PerformanceConfig {
    uint32_t max_concurrency = 4;
    std::chrono::milliseconds request_timeout{30000};
    uint32_t stream_batch_size = 10;  // progress callback granularity
    bool dedicated_admission = false; // true when max_concurrency was set per client
};

struct VisionConfig {
    std::string prompt = "Describe this image in detail for search and embedding purposes:";
    std::string system_prompt =
        "You are a helpful vision AI. Describe images accurately and concisely "
        "for embedding purposes. Focus on key visual elements, objects, scene context, "
        "colors, and composition.";
};

struct Config {
    RuntimeConfig runtime;
    PerformanceConfig performance;
    VisionConfig vision;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from $REMBED_CONFIG or ~/.rembed/config.json, then apply env vars.
    // A missing file is not an error; the file is never written.
    static Config load();

    // Load a specific file (no env overrides)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from already-parsed JSON; unknown or mistyped keys are ignored
    static Config from_json(const nlohmann::json& j);

    // <PROVIDER>_API_KEY and OLLAMA_BASE_URL
    void apply_env_overrides();

    // Get API key for a provider name (empty if none)
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

} // namespace rembed
