#pragma once
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rembed {

// POST a JSON request and parse the JSON reply. Transport failures,
// non-2xx statuses and unparseable bodies all throw ProviderError
// prefixed with the provider name.
nlohmann::json post_json(HttpClient& http,
                         const std::string& provider,
                         const std::string& url,
                         const nlohmann::json& request,
                         const std::vector<Header>& headers,
                         long timeout_seconds);

// Read a JSON array of numbers into an Embedding. what names the field
// for the error message.
std::vector<float> parse_float_array(const nlohmann::json& arr,
                                     const std::string& provider,
                                     const std::string& what);

} // namespace rembed
