#pragma once
#include "embedding_ops.hpp"
#include "runtime.hpp"
#include "semaphore.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rembed {

// Outcome for one input slot
struct PipelineItemResult {
    bool ok = false;
    Embedding embedding;
    std::string error;

    static PipelineItemResult success(Embedding embedding);
    static PipelineItemResult failure(std::string message);
};

struct ProcessingStats {
    uint64_t total_processed = 0;
    uint64_t successful = 0;
    uint64_t failed = 0;
    std::chrono::duration<double, std::milli> total_duration{0};
    std::chrono::duration<double, std::milli> avg_duration_per_item{0};
    double throughput = 0.0;  // items per second
};

ProcessingStats compute_stats(const std::vector<PipelineItemResult>& results,
                              std::chrono::duration<double, std::milli> elapsed);

struct PipelineOutcome {
    std::vector<PipelineItemResult> results;
    ProcessingStats stats;
};

// {"embeddings": [base64 float32 | {"error": msg}], "stats": {...}}
nlohmann::json to_json(const PipelineOutcome& outcome);

// (settled, total), called on the caller's thread
using ProgressCallback = std::function<void(size_t settled, size_t total)>;

// Runs a batch of independent work items with bounded admission and a
// per-item deadline.
//
// At most admission.capacity() items (counted across every batch sharing
// the semaphore) are between admission and completion. An item's deadline
// starts when a worker picks it up, so time spent queued behind a busy
// pool does not count against it. An item whose deadline passes is
// settled as a failure and its permit released; the worker keeps running
// and its late result is dropped. Work functions may therefore outlive
// run() and must own everything they touch.
class ConcurrencyController {
public:
    using Work = std::function<PipelineItemResult()>;

    ConcurrencyController(ExecutionBridge& bridge,
                          std::shared_ptr<Semaphore> admission,
                          std::chrono::milliseconds timeout);

    // One result per work item, in input order. Throws BridgeError when
    // an item cannot be scheduled.
    std::vector<PipelineItemResult> run(std::vector<Work> works,
                                        const ProgressCallback& progress = {},
                                        uint32_t progress_every = 0);

private:
    ExecutionBridge& bridge_;
    std::shared_ptr<Semaphore> admission_;
    std::chrono::milliseconds timeout_;
};

// Describe-then-embed over many images.
class MultimodalPipeline {
public:
    MultimodalPipeline(ExecutionBridge& bridge, std::string default_prompt);

    // Throws UnsupportedOperation (client has no vision model) or
    // BridgeError. Per-item failures land in the outcome.
    PipelineOutcome process(const ClientHandle& client,
                            std::vector<std::string> images,
                            const std::optional<std::string>& prompt = std::nullopt,
                            const ProgressCallback& progress = {});

private:
    ExecutionBridge& bridge_;
    std::string default_prompt_;
};

} // namespace rembed
