#pragma once
#include "client.hpp"
#include "config.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rembed {

// Environment-scoped credential fallback. Returns empty when none.
using CredentialLookup = std::function<std::string(ProviderKind)>;

// Turns any accepted configuration input into a ClientDescriptor.
//
// Grammars are tried in a fixed order and the first that recognises the
// input wins:
//   1. options  - key/value map from rembed_client_options()
//   2. compact  - "provider::model", "provider:credential" or "provider"
//   3. json     - '{"provider": ..., "model": ..., "api_key": ...}'
// A grammar that recognises its form but finds bad content throws
// ConfigError; one that does not recognise the form passes.
class ConfigResolver {
public:
    ConfigResolver(PerformanceConfig defaults, CredentialLookup lookup);

    // Defaults and credential fallback taken from a loaded Config
    explicit ConfigResolver(const Config& config);

    ClientDescriptor resolve(const std::string& name, const ConfigInput& input) const;

private:
    // Raw fields collected by a grammar before validation
    struct Draft {
        std::string grammar;
        std::string provider;
        std::string model;
        std::optional<std::string> credential;
        std::optional<std::string> endpoint;
        std::optional<std::string> vision_model;
        std::optional<std::string> prompt;
        std::optional<uint64_t> max_concurrency;
        std::optional<uint64_t> timeout_ms;
        std::optional<uint64_t> stream_batch_size;
    };

    using Grammar = std::optional<Draft> (*)(const ConfigInput& input);

    static std::optional<Draft> parse_options(const ConfigInput& input);
    static std::optional<Draft> parse_compact(const ConfigInput& input);
    static std::optional<Draft> parse_json(const ConfigInput& input);

    ClientDescriptor finalize(const std::string& name, Draft draft) const;
    std::optional<std::string> credential_for(ProviderKind kind,
                                              const std::optional<std::string>& given) const;

    static const std::vector<Grammar>& grammars();

    PerformanceConfig defaults_;
    CredentialLookup lookup_;
};

} // namespace rembed
