#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include "util.hpp"
#include "providers/mock.hpp"
#include "providers/ollama.hpp"
#include "providers/openai_compatible.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace rembed;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

static ProviderSettings settings_with(const std::string& key, const std::string& url = "") {
    ProviderSettings s;
    s.api_key = key;
    s.base_url = url;
    return s;
}

// ════════════════════════════════════════════════════════════════
// OpenAI-compatible adapter
// ════════════════════════════════════════════════════════════════

TEST_CASE("OpenAICompatibleProvider: embed sends correct request", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [{"index": 0, "embedding": [0.5, -0.25]}]})"};

    OpenAICompatibleProvider provider("openai", settings_with("sk-test"), mock);
    auto embedding = provider.embed("text-embedding-3-small", "hello");

    REQUIRE(mock.last_url == "https://api.openai.com/v1/embeddings");
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer sk-test");
    REQUIRE(find_header(mock.last_headers, "Content-Type") == "application/json");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "text-embedding-3-small");
    REQUIRE(body["input"] == "hello");

    REQUIRE(embedding.size() == 2);
    REQUIRE(embedding[0] == 0.5f);
    REQUIRE(embedding[1] == -0.25f);
}

TEST_CASE("OpenAICompatibleProvider: per-provider default endpoints", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [{"embedding": [1]}]})"};

    OpenAICompatibleProvider cohere("cohere", settings_with("co"), mock);
    cohere.embed("embed-english-v3.0", "x");
    REQUIRE(mock.last_url == "https://api.cohere.ai/compatibility/v1/embeddings");

    OpenAICompatibleProvider mistral("mistral", settings_with("m"), mock);
    mistral.embed("mistral-embed", "x");
    REQUIRE(mock.last_url == "https://api.mistral.ai/v1/embeddings");
}

TEST_CASE("OpenAICompatibleProvider: base URL override drops trailing slash", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [{"embedding": [1]}]})"};

    OpenAICompatibleProvider provider("openai", settings_with("", "http://local:8080/v1/"), mock);
    provider.embed("m", "x");
    REQUIRE(mock.last_url == "http://local:8080/v1/embeddings");
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());
}

TEST_CASE("OpenAICompatibleProvider: batch reorders by index", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [
        {"index": 1, "embedding": [2.0]},
        {"index": 0, "embedding": [1.0]}
    ]})"};

    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);
    auto result = provider.embed_batch("m", {"a", "b"});

    REQUIRE(mock.call_count == 1);
    REQUIRE(json::parse(mock.last_body)["input"] == json::array({"a", "b"}));
    REQUIRE(result.size() == 2);
    REQUIRE(result[0][0] == 1.0f);
    REQUIRE(result[1][0] == 2.0f);
}

TEST_CASE("OpenAICompatibleProvider: batch count mismatch throws", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [{"index": 0, "embedding": [1.0]}]})"};

    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);
    REQUIRE_THROWS_AS(provider.embed_batch("m", {"a", "b"}), ProviderError);
}

TEST_CASE("OpenAICompatibleProvider: duplicate batch index throws", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"data": [
        {"index": 0, "embedding": [1.0]},
        {"index": 0, "embedding": [2.0]}
    ]})"};

    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);
    REQUIRE_THROWS_AS(provider.embed_batch("m", {"a", "b"}), ProviderError);
}

TEST_CASE("OpenAICompatibleProvider: HTTP error becomes ProviderError", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {401, R"({"error": {"message": "Invalid API key"}})"};

    OpenAICompatibleProvider provider("openai", settings_with("bad"), mock);
    try {
        provider.embed("m", "x");
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("HTTP 401") != std::string::npos);
        REQUIRE(msg.find("Invalid API key") != std::string::npos);
    }
}

TEST_CASE("OpenAICompatibleProvider: transport failure becomes ProviderError", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {0, "", "Could not resolve host"};

    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);
    REQUIRE_THROWS_AS(provider.embed("m", "x"), ProviderError);
}

TEST_CASE("OpenAICompatibleProvider: malformed body becomes ProviderError", "[providers][openai]") {
    MockHttpClient mock;
    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);

    mock.next_response = {200, "not json"};
    REQUIRE_THROWS_AS(provider.embed("m", "x"), ProviderError);

    mock.next_response = {200, R"({"data": []})"};
    REQUIRE_THROWS_AS(provider.embed("m", "x"), ProviderError);

    mock.next_response = {200, R"({"data": [{"embedding": ["a"]}]})"};
    REQUIRE_THROWS_AS(provider.embed("m", "x"), ProviderError);
}

TEST_CASE("OpenAICompatibleProvider: describe_image sends a data URL", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": "A red square"}}]})"};

    ProviderSettings settings = settings_with("sk");
    settings.system_prompt = "Be brief.";
    OpenAICompatibleProvider provider("openai", settings, mock);

    std::string png("\x89PNG\r\n\x1a\nDATA", 12);
    auto text = provider.describe_image("gpt-4o-mini", png, "Describe");

    REQUIRE(text == "A red square");
    REQUIRE(mock.last_url == "https://api.openai.com/v1/chat/completions");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][0]["content"] == "Be brief.");
    auto content = body["messages"][1]["content"];
    REQUIRE(content[0]["text"] == "Describe");
    REQUIRE(content[1]["image_url"]["url"] ==
            "data:image/png;base64," + base64_encode(png));
}

TEST_CASE("OpenAICompatibleProvider: empty description throws", "[providers][openai]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"choices": [{"message": {"content": ""}}]})"};

    OpenAICompatibleProvider provider("openai", settings_with("sk"), mock);
    REQUIRE_THROWS_AS(provider.describe_image("m", "img", "p"), ProviderError);
}

// ════════════════════════════════════════════════════════════════
// Ollama adapter
// ════════════════════════════════════════════════════════════════

TEST_CASE("OllamaProvider: embed uses /api/embed", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"embeddings": [[0.1, 0.2, 0.3]]})"};

    OllamaProvider provider({}, mock);
    auto embedding = provider.embed("nomic-embed-text", "hello");

    REQUIRE(mock.last_url == "http://localhost:11434/api/embed");
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());
    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "nomic-embed-text");
    REQUIRE(body["input"] == "hello");
    REQUIRE(embedding.size() == 3);
}

TEST_CASE("OllamaProvider: custom base URL and timeout", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"embeddings": [[1.0]]})"};

    ProviderSettings settings = settings_with("", "http://gpu:11434/");
    settings.timeout_seconds = 7;
    OllamaProvider provider(settings, mock);
    provider.embed("m", "x");

    REQUIRE(mock.last_url == "http://gpu:11434/api/embed");
    REQUIRE(mock.last_timeout == 7);
}

TEST_CASE("OllamaProvider: batch keeps order and checks count", "[providers][ollama]") {
    MockHttpClient mock;
    OllamaProvider provider({}, mock);

    mock.next_response = {200, R"({"embeddings": [[1.0], [2.0]]})"};
    auto result = provider.embed_batch("m", {"a", "b"});
    REQUIRE(result.size() == 2);
    REQUIRE(result[1][0] == 2.0f);

    mock.next_response = {200, R"({"embeddings": [[1.0]]})"};
    REQUIRE_THROWS_AS(provider.embed_batch("m", {"a", "b"}), ProviderError);
}

TEST_CASE("OllamaProvider: describe_image sends base64 images", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"message": {"role": "assistant", "content": "A cat"}})"};

    OllamaProvider provider({}, mock);
    auto text = provider.describe_image("llava:7b", "IMG", "What is it?");

    REQUIRE(text == "A cat");
    REQUIRE(mock.last_url == "http://localhost:11434/api/chat");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["stream"] == false);
    REQUIRE(body["messages"].back()["content"] == "What is it?");
    REQUIRE(body["messages"].back()["images"][0] == base64_encode("IMG"));
}

TEST_CASE("OllamaProvider: server error becomes ProviderError", "[providers][ollama]") {
    MockHttpClient mock;
    mock.next_response = {404, R"({"error": "model 'x' not found"})"};

    OllamaProvider provider({}, mock);
    REQUIRE_THROWS_AS(provider.embed("x", "hello"), ProviderError);
}

// ════════════════════════════════════════════════════════════════
// Mock provider
// ════════════════════════════════════════════════════════════════

TEST_CASE("MockProvider: deterministic embeddings", "[providers][mock]") {
    MockProvider provider;
    auto a = provider.embed("mock-embed-16", "hello");
    auto b = provider.embed("mock-embed-16", "hello");
    auto c = provider.embed("mock-embed-16", "world");
    REQUIRE(a.size() == 16);
    REQUIRE(a == b);
    REQUIRE(a != c);
    for (float v : a) {
        REQUIRE(v >= -1.0f);
        REQUIRE(v <= 1.0f);
    }
}

TEST_CASE("MockProvider: dimensions from model suffix", "[providers][mock]") {
    REQUIRE(MockProvider::dimensions_for("mock-embed-64") == 64);
    REQUIRE(MockProvider::dimensions_for("mock") == MockProvider::kDefaultDimensions);
    REQUIRE(MockProvider::dimensions_for("mock-large") == MockProvider::kDefaultDimensions);
}

TEST_CASE("MockProvider: describe_image is stable and rejects empty images", "[providers][mock]") {
    MockProvider provider;
    auto a = provider.describe_image("mock-vision", "GIF89a-bytes", "Describe");
    REQUIRE(a == provider.describe_image("mock-vision", "GIF89a-bytes", "Describe"));
    REQUIRE(a.find("image/gif") != std::string::npos);
    REQUIRE(a.rfind("Describe", 0) == 0);
    REQUIRE_THROWS_AS(provider.describe_image("mock-vision", "", "Describe"), ProviderError);
}

TEST_CASE("MockProvider: no network", "[providers][mock]") {
    MockHttpClient http;
    auto provider = create_provider(ProviderKind::Mock, {}, http);
    provider->embed_batch("mock-embed-4", {"a", "b", "c"});
    REQUIRE(http.call_count == 0);
}
