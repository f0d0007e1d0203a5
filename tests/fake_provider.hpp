#pragma once
#include "client_registry.hpp"
#include "errors.hpp"
#include "provider.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace rembed {

// Scriptable provider for operation and pipeline tests. Images listed in
// fail_describe fail stage A; descriptions containing fail_embed_marker
// fail stage B. Tracks how many describe calls overlap.
class FakeProvider : public EmbeddingProvider {
public:
    std::chrono::milliseconds describe_delay{0};
    std::set<std::string> fail_describe;
    std::set<std::string> slow_images;             // sleep slow_delay instead
    std::chrono::milliseconds slow_delay{0};
    std::string fail_embed_marker = "<fail-embed>";
    size_t batch_result_size = SIZE_MAX;           // override to simulate a bad reply

    std::atomic<int> embed_calls{0};
    std::atomic<int> batch_calls{0};
    std::atomic<int> describe_calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    std::string last_prompt() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_prompt_;
    }

    Embedding embed(const std::string&, const std::string& text) override {
        ++embed_calls;
        if (text.find(fail_embed_marker) != std::string::npos) {
            throw ProviderError("fake API error (HTTP 500): embed rejected");
        }
        return {static_cast<float>(text.size()), 1.0f};
    }

    std::vector<Embedding> embed_batch(const std::string&,
                                       const std::vector<std::string>& texts) override {
        ++batch_calls;
        std::vector<Embedding> out;
        for (const auto& t : texts) {
            if (t.find(fail_embed_marker) != std::string::npos) {
                throw ProviderError("fake API error (HTTP 400): bad batch");
            }
            out.push_back({static_cast<float>(t.size()), 1.0f});
        }
        if (batch_result_size != SIZE_MAX) out.resize(batch_result_size);
        return out;
    }

    std::string describe_image(const std::string&, const std::string& image,
                               const std::string& prompt) override {
        ++describe_calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_prompt_ = prompt;
        }
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}

        auto delay = slow_images.count(image) ? slow_delay : describe_delay;
        std::this_thread::sleep_for(delay);
        --in_flight;

        if (fail_describe.count(image)) {
            throw ProviderError("fake vision error (HTTP 422): unreadable image");
        }
        return "description of " + image;
    }

    std::string provider_name() const override { return "fake"; }

private:
    std::mutex mutex_;
    std::string last_prompt_;
};

// Registered client around a FakeProvider, without going through a registry
inline std::shared_ptr<RegisteredClient> make_fake_client(
        std::shared_ptr<FakeProvider> provider,
        uint32_t max_concurrency = 4,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
        bool vision = true) {
    auto client = std::make_shared<RegisteredClient>();
    client->name = "fake";
    client->descriptor.provider = ProviderKind::Mock;
    client->descriptor.model = "fake-embed";
    if (vision) {
        client->descriptor.vision_model = "fake-vision";
        client->descriptor.vision_provider = ProviderKind::Mock;
        client->vision = provider;
    }
    client->descriptor.performance.max_concurrency = max_concurrency;
    client->descriptor.performance.request_timeout = timeout;
    client->descriptor.performance.dedicated_admission = true;
    client->embedder = provider;
    client->admission = std::make_shared<Semaphore>(max_concurrency);
    return client;
}

} // namespace rembed
