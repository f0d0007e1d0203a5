#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace rembed {

using Embedding = std::vector<float>;

// The closed set of providers a client may name.
enum class ProviderKind {
    OpenAI,
    Gemini,
    Cohere,
    Anthropic,
    Ollama,
    Groq,
    DeepSeek,
    XAI,
    Mistral,
    Voyage,
    Mock
};

struct ProviderTraits {
    ProviderKind kind;
    const char* name;              // canonical tag, e.g. "openai"
    const char* env_var;           // credential fallback, nullptr if none
    const char* default_base_url;
    bool requires_credential;
};

const ProviderTraits& provider_traits(ProviderKind kind);
const std::vector<ProviderTraits>& all_provider_traits();

inline const char* provider_to_string(ProviderKind kind) {
    return provider_traits(kind).name;
}

// Case-insensitive. Accepts canonical tags plus the aliases google,
// nomic, jina, mixedbread and llamafile.
std::optional<ProviderKind> provider_from_string(const std::string& name);

// Everything an adapter needs to build a handle.
struct ProviderSettings {
    std::string api_key;        // empty = no Authorization header
    std::string base_url;       // empty = provider default
    long timeout_seconds = 30;
    std::string system_prompt;  // used by describe_image, may be empty
};

// A constructed, reusable connection to one provider. Handles are shared
// between worker threads and must not mutate state after construction.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // One embedding for one text
    virtual Embedding embed(const std::string& model, const std::string& text) = 0;

    // One request for many texts. Output order matches input order.
    virtual std::vector<Embedding> embed_batch(const std::string& model,
                                               const std::vector<std::string>& texts) = 0;

    // Ask a vision-capable model for a textual description of raw image bytes
    virtual std::string describe_image(const std::string& model,
                                       const std::string& image,
                                       const std::string& prompt) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration

// Factory: build a handle for a provider via the plugin registry
std::shared_ptr<EmbeddingProvider> create_provider(ProviderKind kind,
                                                   const ProviderSettings& settings,
                                                   HttpClient& http);

// Best-effort MIME type from magic bytes; "image/jpeg" when unknown.
std::string detect_image_mime(const std::string& image);

} // namespace rembed
