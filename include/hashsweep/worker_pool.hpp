#pragma once

#include "hashsweep/hasher.hpp"
#include "hashsweep/logging.hpp"
#include "hashsweep/result_store.hpp"
#include "hashsweep/task_channel.hpp"
#include "hashsweep/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace hashsweep {

/**
 * Cancellation token for cooperative stop requests from outside the pool.
 * Workers only look at it after a take() timed out, so queued chunks and
 * Shutdown markers are never skipped on its account.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_;
};

/**
 * One hash-and-compare executor. run() loops on the channel until it
 * consumes a Shutdown marker (or the channel fails) and returns its stats.
 */
class Worker {
public:
    Worker(std::size_t worker_id,
           std::shared_ptr<TaskChannel> channel,
           std::shared_ptr<ResultStore> store,
           std::unique_ptr<Hasher> hasher,
           const std::string& target_hash,
           std::chrono::milliseconds take_timeout,
           std::shared_ptr<Logger> logger,
           std::shared_ptr<const CancellationToken> stop_token = nullptr);

    WorkerStats run();

    // Hash every candidate of `chunk`; matches go to the store.
    void process_chunk(const Chunk& chunk);

    const WorkerStats& stats() const { return stats_; }

private:
    void record_match(const Candidate& candidate, const std::string& digest);

    std::shared_ptr<TaskChannel> channel_;
    std::shared_ptr<ResultStore> store_;
    std::unique_ptr<Hasher> hasher_;
    std::string target_hash_;
    std::chrono::milliseconds take_timeout_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<const CancellationToken> stop_token_;
    WorkerStats stats_;
};

enum class PoolState {
    Idle,
    Running,
    Draining,
    Terminated
};

const char* to_string(PoolState state);

/**
 * Supervised group of workers sharing one channel and one result store.
 *
 * Lifecycle: Idle -> start() -> Running -> drain() -> Draining -> join()
 * -> Terminated. Collection must wait for Terminated; only then are all
 * writers to the result store finished.
 */
class WorkerPool {
public:
    WorkerPool(std::size_t worker_count,
               std::shared_ptr<TaskChannel> channel,
               std::shared_ptr<ResultStore> store,
               HasherFactory hasher_factory,
               std::string target_hash,
               std::chrono::milliseconds take_timeout,
               std::shared_ptr<Logger> logger,
               std::shared_ptr<CancellationToken> stop_token = nullptr);

    // Stops and joins any workers still running.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Spawn the workers. Throws std::logic_error unless Idle.
    void start();

    // Send one Shutdown marker per worker. Call after every chunk is submitted.
    void drain();

    // Block until every worker has exited; returns stats ordered by worker id.
    std::vector<WorkerStats> join();

    // External interruption; idle workers exit on their next take timeout.
    void request_stop();

    PoolState state() const { return state_.load(std::memory_order_acquire); }
    std::size_t worker_count() const { return worker_count_; }
    std::size_t active_workers() const { return active_.load(std::memory_order_acquire); }

private:
    std::size_t worker_count_;
    std::shared_ptr<TaskChannel> channel_;
    std::shared_ptr<ResultStore> store_;
    HasherFactory hasher_factory_;
    std::string target_hash_;
    std::chrono::milliseconds take_timeout_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<CancellationToken> stop_token_;

    std::vector<std::thread> threads_;
    std::vector<WorkerStats> stats_;
    std::atomic<PoolState> state_;
    std::atomic<std::size_t> active_;
};

} // namespace hashsweep
