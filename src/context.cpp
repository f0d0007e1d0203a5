#include "context.hpp"

namespace rembed {

Context::Context(Config config)
    : config_(std::move(config))
    , resolver_(config_)
    , registry_(default_handle_factory(shared_http_client(), config_),
                config_.performance.max_concurrency, config_.vision.system_prompt)
    , bridge_(config_.runtime.worker_threads)
    , ops_(bridge_, config_.vision.prompt)
    , pipeline_(bridge_, config_.vision.prompt) {}

Context::Context(Config config, HttpClient& http, WorkerPool& pool)
    : config_(std::move(config))
    , resolver_(config_)
    , registry_(default_handle_factory(http, config_),
                config_.performance.max_concurrency, config_.vision.system_prompt)
    , bridge_(pool)
    , ops_(bridge_, config_.vision.prompt)
    , pipeline_(bridge_, config_.vision.prompt) {}

Context::Context(Config config, HandleFactory factory, WorkerPool& pool)
    : config_(std::move(config))
    , resolver_(config_)
    , registry_(std::move(factory),
                config_.performance.max_concurrency, config_.vision.system_prompt)
    , bridge_(pool)
    , ops_(bridge_, config_.vision.prompt)
    , pipeline_(bridge_, config_.vision.prompt) {}

std::shared_ptr<const RegisteredClient> Context::register_client(const std::string& name,
                                                                 const ConfigInput& input) {
    return registry_.register_client(name, resolver_.resolve(name, input));
}

Embedding Context::embed_one(const std::string& name, const std::string& text) {
    return ops_.embed_one(registry_.lookup(name), text);
}

std::vector<Embedding> Context::embed_many(const std::string& name,
                                           const std::vector<std::string>& texts) {
    return ops_.embed_many(registry_.lookup(name), texts);
}

Embedding Context::embed_image(const std::string& name, const std::string& image,
                               const std::optional<std::string>& prompt) {
    return ops_.embed_image(registry_.lookup(name), image, prompt);
}

PipelineOutcome Context::process_multimodal(const std::string& name,
                                            std::vector<std::string> images,
                                            const std::optional<std::string>& prompt,
                                            const ProgressCallback& progress) {
    return pipeline_.process(registry_.lookup(name), std::move(images), prompt, progress);
}

nlohmann::json Context::describe_client(const std::string& name) const {
    return registry_.lookup(name)->descriptor.to_json();
}

} // namespace rembed
