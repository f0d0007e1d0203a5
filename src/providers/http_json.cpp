#include "http_json.hpp"
#include "../errors.hpp"

namespace rembed {

using json = nlohmann::json;

// Provider error bodies can be large HTML pages; keep the message readable.
static std::string clip(const std::string& body) {
    constexpr size_t kMax = 512;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

json post_json(HttpClient& http,
               const std::string& provider,
               const std::string& url,
               const json& request,
               const std::vector<Header>& headers,
               long timeout_seconds) {
    auto response = http.post(url, request.dump(), headers, timeout_seconds);

    if (response.status_code == 0) {
        throw ProviderError(provider + " request failed: " +
            (response.error.empty() ? "no response" : response.error));
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ProviderError(provider + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + clip(response.body));
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ProviderError(provider + " returned invalid JSON: " + e.what());
    }
}

std::vector<float> parse_float_array(const json& arr,
                                     const std::string& provider,
                                     const std::string& what) {
    if (!arr.is_array()) {
        throw ProviderError(provider + " response: expected '" + what + "' to be an array");
    }
    std::vector<float> result;
    result.reserve(arr.size());
    for (const auto& val : arr) {
        if (!val.is_number()) {
            throw ProviderError(provider + " response: expected '" + what +
                                "' array to contain numbers");
        }
        result.push_back(val.get<float>());
    }
    return result;
}

} // namespace rembed
