#include "client.hpp"

namespace rembed {

std::string ClientDescriptor::qualified_model() const {
    return std::string(provider_to_string(provider)) + "::" + model;
}

std::string ClientDescriptor::qualified_vision_model() const {
    if (!vision_model) return {};
    return std::string(provider_to_string(vision_provider)) + "::" + *vision_model;
}

nlohmann::json ClientDescriptor::to_json() const {
    nlohmann::json j = {
        {"provider", provider_to_string(provider)},
        {"model", model},
        {"has_credential", credential.has_value()},
        {"max_concurrency", performance.max_concurrency},
        {"request_timeout_ms", performance.request_timeout.count()},
        {"stream_batch_size", performance.stream_batch_size}
    };
    if (endpoint_override) j["base_url"] = *endpoint_override;
    if (vision_model) j["vision_model"] = qualified_vision_model();
    return j;
}

} // namespace rembed
