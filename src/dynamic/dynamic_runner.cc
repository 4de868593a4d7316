#include "dynamic_runner.h"

#include <algorithm>
#include <thread>
#include <utility>

#include <folly/MPMCQueue.h>
#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

int64_t DeriveSeed(int64_t base_seed, int thread_id) {
    if (base_seed < 0) {
        return base_seed;
    }
    // SplitMix64 finaliser over (base, thread_id).
    uint64_t z = static_cast<uint64_t>(base_seed) +
                 static_cast<uint64_t>(thread_id + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z = z ^ (z >> 31);
    // Samplers read seeds as 32-bit signed integers.
    return static_cast<int64_t>(z & 0x7FFFFFFFULL);
}

std::string ThreadFileRoot(const std::string& file_root, size_t index) {
    return file_root + "_thread" + std::to_string(index);
}

DynamicRunner::DynamicRunner(ISampler& sampler, RunnerOptions options)
    : sampler_(sampler), options_(options) {
    if (options_.num_workers < 1) {
        throw ConfigurationError("num_workers must be >= 1, got " + std::to_string(options_.num_workers));
    }
    if (options_.queue_capacity < 1) {
        throw ConfigurationError("queue_capacity must be >= 1");
    }
}

SamplerConfig DynamicRunner::ThreadConfig(const SamplerConfig& base, const AllocationEntry& entry,
                                          size_t index) {
    SamplerConfig config = base;
    config.thread_id = static_cast<int>(index) + 1;
    config.nlive = entry.nlive;
    config.start_threshold = entry.start_logl;
    config.stop_threshold = entry.end_logl;
    config.file_root = ThreadFileRoot(base.file_root, index);
    config.seed = DeriveSeed(base.seed, config.thread_id);
    return config;
}

void DynamicRunner::RecordFailure(std::exception_ptr error, CancellationToken& cancel) {
    {
        absl::MutexLock lock(&mutex_);
        if (!first_error_) {
            first_error_ = error;
        }
    }
    cancel.Cancel();
}

void DynamicRunner::RunTask(const Task& task, CancellationToken& cancel,
                            std::vector<RunRecord>& results) {
    if (cancel.IsCancelled()) {
        return;
    }
    VLOG(1) << "Thread " << task.index << ": nlive " << task.config.nlive << ", logl ("
            << *task.config.start_threshold << ", " << *task.config.stop_threshold << "]";
    try {
        RunRecord run = sampler_.Run(task.config, &cancel);
        if (run.thread_id() != task.config.thread_id) {
            throw MalformedOutputError(static_cast<int>(task.index),
                "sampler returned thread_id " + std::to_string(run.thread_id()));
        }
        results[task.index] = std::move(run);
    } catch (const DynamicNestError& e) {
        if (!dynamic_cast<const CancelledError*>(&e)) {
            LOG(ERROR) << "Thread " << task.index << " failed: " << e.what();
        }
        RecordFailure(std::current_exception(), cancel);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Thread " << task.index << " failed: " << e.what();
        RecordFailure(std::make_exception_ptr(ExternalRunFailure(
            "dynamic_runner", static_cast<int>(task.index), 0, e.what())), cancel);
    }
}

std::vector<RunRecord> DynamicRunner::Run(const AllocationPlan& plan, const SamplerConfig& base,
                                          CancellationToken* cancel) {
    {
        absl::MutexLock lock(&mutex_);
        first_error_ = nullptr;
    }
    CancellationToken local_cancel;
    CancellationToken& token = cancel != nullptr ? *cancel : local_cancel;

    std::vector<RunRecord> results(plan.entries.size());
    std::vector<Task> tasks;
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        const AllocationEntry& entry = plan.entries[i];
        if (entry.nlive <= 0 || entry.start_logl >= plan.init_max_logl) {
            results[i] = RunRecord({}, {}, static_cast<int>(i) + 1, entry.start_logl);
            continue;
        }
        tasks.push_back({i, ThreadConfig(base, entry, i)});
    }
    LOG(INFO) << "Dispatching " << tasks.size() << " of " << plan.entries.size()
              << " threads on " << options_.num_workers << " workers";

    folly::MPMCQueue<std::optional<Task>> queue(options_.queue_capacity);
    size_t num_workers = std::min(static_cast<size_t>(options_.num_workers),
                                  std::max<size_t>(tasks.size(), 1));
    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t w = 0; w < num_workers; ++w) {
        workers.emplace_back([this, &queue, &token, &results]() {
            std::optional<Task> task;
            while (true) {
                queue.blockingRead(task);
                if (!task.has_value()) {
                    break;
                }
                RunTask(*task, token, results);
            }
        });
    }

    for (Task& task : tasks) {
        if (token.IsCancelled()) {
            break;
        }
        std::optional<Task> item(std::move(task));
        queue.blockingWrite(std::move(item));
    }
    for (size_t w = 0; w < num_workers; ++w) {
        std::optional<Task> sentinel = std::nullopt;
        queue.blockingWrite(std::move(sentinel));
    }
    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::exception_ptr error;
    {
        absl::MutexLock lock(&mutex_);
        error = first_error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
    if (token.IsCancelled()) {
        throw CancelledError("dynamic run cancelled before all threads finished");
    }
    return results;
}

} // namespace DynamicNest
