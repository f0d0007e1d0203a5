#include "multimodal.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>

namespace rembed {

using Clock = std::chrono::steady_clock;

PipelineItemResult PipelineItemResult::success(Embedding embedding) {
    PipelineItemResult r;
    r.ok = true;
    r.embedding = std::move(embedding);
    return r;
}

PipelineItemResult PipelineItemResult::failure(std::string message) {
    PipelineItemResult r;
    r.ok = false;
    r.error = std::move(message);
    return r;
}

ProcessingStats compute_stats(const std::vector<PipelineItemResult>& results,
                              std::chrono::duration<double, std::milli> elapsed) {
    ProcessingStats stats;
    stats.total_processed = results.size();
    for (const auto& r : results) {
        if (r.ok) ++stats.successful;
        else ++stats.failed;
    }
    stats.total_duration = elapsed;
    if (stats.total_processed > 0) {
        stats.avg_duration_per_item = elapsed / static_cast<double>(stats.total_processed);
    }
    double seconds = elapsed.count() / 1000.0;
    if (seconds > 0.0) {
        stats.throughput = static_cast<double>(stats.total_processed) / seconds;
    }
    return stats;
}

nlohmann::json to_json(const PipelineOutcome& outcome) {
    nlohmann::json embeddings = nlohmann::json::array();
    for (const auto& r : outcome.results) {
        if (r.ok) {
            embeddings.push_back(base64_encode(floats_to_blob(r.embedding)));
        } else {
            embeddings.push_back({{"error", r.error}});
        }
    }
    const auto& s = outcome.stats;
    return {
        {"embeddings", embeddings},
        {"stats", {
            {"total_processed", s.total_processed},
            {"successful", s.successful},
            {"failed", s.failed},
            {"total_duration_ms", s.total_duration.count()},
            {"avg_duration_per_item_ms", s.avg_duration_per_item.count()},
            {"throughput", s.throughput}
        }}
    };
}

// ── ConcurrencyController ───────────────────────────────────────

namespace {

// start + timeout, clamped to time_point::max()
Clock::time_point deadline_after(Clock::time_point start, std::chrono::milliseconds timeout) {
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - start);
    if (timeout >= headroom) return Clock::time_point::max();
    return start + timeout;
}

using Deadline = std::pair<Clock::time_point, size_t>;

// Shared between the coordinating thread and the workers. Workers hold
// it by shared_ptr so an abandoned item can still settle harmlessly.
struct BatchState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<PipelineItemResult> results;
    std::vector<bool> settled;
    size_t settled_count = 0;
    size_t waiting_to_start = 0;  // admitted, not yet picked up by a worker
    std::priority_queue<Deadline, std::vector<Deadline>, std::greater<Deadline>> deadlines;
    std::shared_ptr<Semaphore> admission;

    // Called by the worker before running the item
    void start(size_t index, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(mutex);
        --waiting_to_start;
        deadlines.emplace(deadline_after(Clock::now(), timeout), index);
    }

    // First settlement wins and returns the item's permit. Caller holds mutex.
    bool settle_locked(size_t index, PipelineItemResult result) {
        if (settled[index]) return false;
        results[index] = std::move(result);
        settled[index] = true;
        ++settled_count;
        admission->release();
        return true;
    }

    void settle(size_t index, PipelineItemResult result) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!settle_locked(index, std::move(result))) return;
        }
        cv.notify_all();
    }
};

PipelineItemResult run_guarded(const ConcurrencyController::Work& work) {
    try {
        return work();
    } catch (const std::exception& e) {
        return PipelineItemResult::failure(e.what());
    }
}

} // namespace

ConcurrencyController::ConcurrencyController(ExecutionBridge& bridge,
                                             std::shared_ptr<Semaphore> admission,
                                             std::chrono::milliseconds timeout)
    : bridge_(bridge), admission_(std::move(admission)), timeout_(timeout) {}

std::vector<PipelineItemResult> ConcurrencyController::run(std::vector<Work> works,
                                                           const ProgressCallback& progress,
                                                           uint32_t progress_every) {
    const size_t total = works.size();
    if (total == 0) return {};

    auto state = std::make_shared<BatchState>();
    state->results.resize(total);
    state->settled.assign(total, false);
    state->admission = admission_;

    const std::string timeout_message =
        "timed out after " + std::to_string(timeout_.count()) + " ms";
    size_t next = 0;
    size_t reported = 0;

    auto report = [&](size_t settled_now) {
        if (!progress || settled_now == reported) return;
        bool boundary = progress_every > 0 &&
                        settled_now / progress_every > reported / progress_every;
        if (boundary || settled_now == total) {
            reported = settled_now;
            progress(settled_now, total);
        }
    };

    for (;;) {
        Clock::time_point earliest = Clock::time_point::max();
        std::vector<size_t> expired;
        size_t settled_now;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto now = Clock::now();
            while (!state->deadlines.empty()) {
                auto [deadline, index] = state->deadlines.top();
                if (state->settled[index]) {
                    state->deadlines.pop();
                } else if (deadline <= now) {
                    state->deadlines.pop();
                    state->settle_locked(index, PipelineItemResult::failure(timeout_message));
                    expired.push_back(index);
                } else {
                    earliest = deadline;
                    break;
                }
            }
            // An item picked up from now on cannot expire before now + timeout
            if (state->waiting_to_start > 0) {
                earliest = std::min(earliest, deadline_after(now, timeout_));
            }
            settled_now = state->settled_count;
        }
        for (size_t index : expired) {
            std::cerr << "[pipeline] Item " << index << " " << timeout_message << "\n";
        }
        report(settled_now);
        if (settled_now == total) break;

        if (next < total) {
            bool admitted;
            if (earliest == Clock::time_point::max()) {
                admission_->acquire();
                admitted = true;
            } else {
                admitted = admission_->try_acquire_until(earliest);
            }
            if (!admitted) continue;

            size_t index = next++;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                ++state->waiting_to_start;
            }
            try {
                bridge_.spawn([state, index, timeout = timeout_, work = std::move(works[index])] {
                    state->start(index, timeout);
                    state->settle(index, run_guarded(work));
                });
            } catch (const std::exception& e) {
                // Nothing was queued for this item, so the permit is still ours
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    --state->waiting_to_start;
                }
                admission_->release();
                std::cerr << "[pipeline] Failed to schedule item " << index << ": "
                          << e.what() << "\n";
                throw BridgeError(std::string("failed to schedule item ") +
                                  std::to_string(index) + ": " + e.what());
            }
        } else {
            std::unique_lock<std::mutex> lock(state->mutex);
            auto changed = [&] { return state->settled_count != settled_now; };
            if (earliest == Clock::time_point::max()) {
                state->cv.wait(lock, changed);
            } else {
                state->cv.wait_until(lock, earliest, changed);
            }
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->results;
}

// ── MultimodalPipeline ──────────────────────────────────────────

MultimodalPipeline::MultimodalPipeline(ExecutionBridge& bridge, std::string default_prompt)
    : bridge_(bridge), default_prompt_(std::move(default_prompt)) {}

PipelineOutcome MultimodalPipeline::process(const ClientHandle& client,
                                            std::vector<std::string> images,
                                            const std::optional<std::string>& prompt,
                                            const ProgressCallback& progress) {
    if (!client->descriptor.has_vision()) {
        throw UnsupportedOperation(client->name,
                                   "multimodal processing (no vision_model configured)");
    }

    PipelineOutcome outcome;
    if (images.empty()) return outcome;

    std::string effective_prompt = prompt && !prompt->empty()
        ? *prompt
        : client->descriptor.vision_prompt.value_or(default_prompt_);

    std::vector<ConcurrencyController::Work> works;
    works.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        works.push_back([client, image = std::move(images[i]), effective_prompt, i] {
            try {
                return PipelineItemResult::success(
                    describe_then_embed(*client, image, effective_prompt));
            } catch (const ProviderError& e) {
                std::cerr << "[pipeline] Item " << i << " failed at " << e.stage()
                          << ": " << e.detail() << "\n";
                return PipelineItemResult::failure(e.stage() + ": " + e.detail());
            }
        });
    }

    const auto& perf = client->descriptor.performance;
    ConcurrencyController controller(bridge_, client->admission, perf.request_timeout);

    auto start = Clock::now();
    outcome.results = controller.run(std::move(works), progress, perf.stream_batch_size);
    outcome.stats = compute_stats(outcome.results, Clock::now() - start);

    std::cerr << "[pipeline] Client '" << client->name << "': "
              << outcome.stats.successful << "/" << outcome.stats.total_processed
              << " succeeded in " << static_cast<long long>(outcome.stats.total_duration.count())
              << " ms\n";
    return outcome;
}

} // namespace rembed
