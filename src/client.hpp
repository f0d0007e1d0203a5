#pragma once
#include "config.hpp"
#include "provider.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace rembed {

// Key/value pairs as given to rembed_client_options()
using ClientOptions = std::map<std::string, std::string>;

// Everything a caller may hand to registration
using ConfigInput = std::variant<ClientOptions, std::string>;

// Canonical, validated client configuration. Immutable once resolved.
struct ClientDescriptor {
    ProviderKind provider = ProviderKind::OpenAI;
    std::string model;
    std::optional<std::string> credential;
    std::optional<std::string> endpoint_override;

    // Multimodal only. The vision model may live on another provider.
    std::optional<std::string> vision_model;
    ProviderKind vision_provider = ProviderKind::OpenAI;
    std::optional<std::string> vision_credential;
    std::optional<std::string> vision_prompt;

    PerformanceConfig performance;

    bool has_vision() const { return vision_model.has_value(); }

    // "provider::model"
    std::string qualified_model() const;
    std::string qualified_vision_model() const;

    // Safe to show to users: credentials are reported only as present/absent
    nlohmann::json to_json() const;
};

} // namespace rembed
