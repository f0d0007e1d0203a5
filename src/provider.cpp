#include "provider.hpp"
#include "plugin.hpp"
#include "util.hpp"

namespace rembed {

const std::vector<ProviderTraits>& all_provider_traits() {
    static const std::vector<ProviderTraits> kTraits = {
        {ProviderKind::OpenAI,    "openai",    "OPENAI_API_KEY",
         "https://api.openai.com/v1", true},
        {ProviderKind::Gemini,    "gemini",    "GEMINI_API_KEY",
         "https://generativelanguage.googleapis.com/v1beta/openai", true},
        {ProviderKind::Cohere,    "cohere",    "CO_API_KEY",
         "https://api.cohere.ai/compatibility/v1", true},
        {ProviderKind::Anthropic, "anthropic", "ANTHROPIC_API_KEY",
         "https://api.anthropic.com/v1", true},
        {ProviderKind::Ollama,    "ollama",    nullptr,
         "http://localhost:11434", false},
        {ProviderKind::Groq,      "groq",      "GROQ_API_KEY",
         "https://api.groq.com/openai/v1", true},
        {ProviderKind::DeepSeek,  "deepseek",  "DEEPSEEK_API_KEY",
         "https://api.deepseek.com/v1", true},
        {ProviderKind::XAI,       "xai",       "XAI_API_KEY",
         "https://api.x.ai/v1", true},
        {ProviderKind::Mistral,   "mistral",   "MISTRAL_API_KEY",
         "https://api.mistral.ai/v1", true},
        {ProviderKind::Voyage,    "voyage",    "VOYAGE_API_KEY",
         "https://api.voyageai.com/v1", true},
        {ProviderKind::Mock,      "mock",      nullptr,
         "", false},
    };
    return kTraits;
}

const ProviderTraits& provider_traits(ProviderKind kind) {
    for (const auto& t : all_provider_traits()) {
        if (t.kind == kind) return t;
    }
    // Unreachable while the table covers every enumerator.
    return all_provider_traits().back();
}

std::optional<ProviderKind> provider_from_string(const std::string& name) {
    std::string lower = to_lower(trim(name));
    for (const auto& t : all_provider_traits()) {
        if (lower == t.name) return t.kind;
    }
    if (lower == "google") return ProviderKind::Gemini;
    // Legacy format names served through OpenAI-compatible or Ollama APIs
    if (lower == "nomic" || lower == "jina" || lower == "mixedbread") return ProviderKind::OpenAI;
    if (lower == "llamafile") return ProviderKind::Ollama;
    return std::nullopt;
}

std::shared_ptr<EmbeddingProvider> create_provider(ProviderKind kind,
                                                   const ProviderSettings& settings,
                                                   HttpClient& http) {
    return PluginRegistry::instance().create_provider(provider_to_string(kind), settings, http);
}

std::string detect_image_mime(const std::string& image) {
    auto starts_with = [&](const char* magic, size_t len) {
        return image.size() >= len && image.compare(0, len, magic, len) == 0;
    };
    if (starts_with("\x89PNG\r\n\x1a\n", 8)) return "image/png";
    if (starts_with("\xFF\xD8\xFF", 3)) return "image/jpeg";
    if (starts_with("GIF87a", 6) || starts_with("GIF89a", 6)) return "image/gif";
    if (image.size() >= 12 && starts_with("RIFF", 4) && image.compare(8, 4, "WEBP") == 0)
        return "image/webp";
    return "image/jpeg";
}

} // namespace rembed
