#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace rembed;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.runtime.worker_threads == 16);
    REQUIRE(cfg.performance.max_concurrency == 4);
    REQUIRE(cfg.performance.request_timeout == std::chrono::milliseconds(30000));
    REQUIRE(cfg.performance.stream_batch_size == 10);
    REQUIRE_FALSE(cfg.performance.dedicated_admission);
    REQUIRE_FALSE(cfg.vision.prompt.empty());
    REQUIRE(cfg.api_key_for("openai").empty());
}

TEST_CASE("Config::defaults_json: lists every keyed provider", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j["providers"].contains("openai"));
    REQUIRE(j["providers"].contains("ollama"));
    REQUIRE_FALSE(j["providers"].contains("mock"));
    REQUIRE(j["performance"]["request_timeout_ms"] == 30000);
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: returns correct key per provider", "[config]") {
    Config cfg;
    cfg.providers["openai"].api_key = "sk-oai-456";
    cfg.providers["cohere"].api_key = "co-789";

    REQUIRE(cfg.api_key_for("openai") == "sk-oai-456");
    REQUIRE(cfg.api_key_for("cohere") == "co-789");
    REQUIRE(cfg.api_key_for("unknown").empty());
    REQUIRE(cfg.api_key_for("").empty());
}

TEST_CASE("Config::base_url_for: only configured providers", "[config]") {
    Config cfg;
    cfg.providers["ollama"].base_url = "http://ollama:11434";
    REQUIRE(cfg.base_url_for("ollama") == "http://ollama:11434");
    REQUIRE(cfg.base_url_for("openai").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "runtime": {"worker_threads": 4},
        "performance": {"max_concurrency": 8, "request_timeout_ms": 1500, "stream_batch_size": 2},
        "vision": {"prompt": "What is this?", "system_prompt": ""},
        "providers": {"openai": {"api_key": "sk-file"}}
    })"));
    REQUIRE(cfg.runtime.worker_threads == 4);
    REQUIRE(cfg.performance.max_concurrency == 8);
    REQUIRE(cfg.performance.request_timeout == std::chrono::milliseconds(1500));
    REQUIRE(cfg.performance.stream_batch_size == 2);
    REQUIRE(cfg.vision.prompt == "What is this?");
    REQUIRE(cfg.vision.system_prompt.empty());
    REQUIRE(cfg.api_key_for("openai") == "sk-file");
}

TEST_CASE("Config::from_json: zero and mistyped numbers keep defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "runtime": {"worker_threads": 0},
        "performance": {"max_concurrency": "eight", "request_timeout_ms": -5}
    })"));
    REQUIRE(cfg.runtime.worker_threads == 16);
    REQUIRE(cfg.performance.max_concurrency == 4);
    REQUIRE(cfg.performance.request_timeout == std::chrono::milliseconds(30000));
}

TEST_CASE("Config::from_json: out-of-range numbers keep defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "runtime": {"worker_threads": 4294967296},
        "performance": {
            "max_concurrency": 4294967297,
            "request_timeout_ms": 86400001,
            "stream_batch_size": 18446744073709551615
        }
    })"));
    REQUIRE(cfg.runtime.worker_threads == 16);
    REQUIRE(cfg.performance.max_concurrency == 4);
    REQUIRE(cfg.performance.request_timeout == std::chrono::milliseconds(30000));
    REQUIRE(cfg.performance.stream_batch_size == 10);

    auto edge = Config::from_json(nlohmann::json::parse(
        R"({"performance": {"request_timeout_ms": 86400000}})"));
    REQUIRE(edge.performance.request_timeout == std::chrono::milliseconds(86400000));
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "rembed_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("REMBED_CONFIG");
        unsetenv("OPENAI_API_KEY");
        unsetenv("CO_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.rembed/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.rembed");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "providers": {
            "openai": { "api_key": "sk-file-oai" },
            "ollama": { "base_url": "http://custom:9999" }
        },
        "performance": { "max_concurrency": 2 }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "sk-file-oai");
    REQUIRE(cfg.base_url_for("ollama") == "http://custom:9999");
    REQUIRE(cfg.performance.max_concurrency == 2);
    // Merged from defaults
    REQUIRE(cfg.performance.stream_batch_size == 10);
}

TEST_CASE("Config::load: REMBED_CONFIG points at another file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"runtime": {"worker_threads": 3}})";
    }
    setenv("REMBED_CONFIG", path.c_str(), 1);

    Config cfg = Config::load();
    REQUIRE(cfg.runtime.worker_threads == 3);

    unsetenv("REMBED_CONFIG");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"providers": {"openai": {"api_key": "from-file"}}})");
    setenv("OPENAI_API_KEY", "from-env", 1);
    setenv("CO_API_KEY", "co-env", 1);
    setenv("OLLAMA_BASE_URL", "http://env:1234", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "from-env");
    REQUIRE(cfg.api_key_for("cohere") == "co-env");
    REQUIRE(cfg.base_url_for("ollama") == "http://env:1234");

    unsetenv("OPENAI_API_KEY");
    unsetenv("CO_API_KEY");
    unsetenv("OLLAMA_BASE_URL");
}

TEST_CASE("Config::load: empty env var does not clear the file value", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"providers": {"openai": {"api_key": "from-file"}}})");
    setenv("OPENAI_API_KEY", "", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("openai") == "from-file");

    unsetenv("OPENAI_API_KEY");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.performance.max_concurrency == 4);
    REQUIRE(cfg.api_key_for("openai").empty());
}

TEST_CASE("Config::load: missing config file uses defaults and writes nothing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.runtime.worker_threads == 16);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}
