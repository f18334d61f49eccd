#pragma once

#include "hashsweep/logging.hpp"
#include "hashsweep/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hashsweep {

struct ChannelStatistics {
    std::size_t tasks_added = 0;        // chunks submitted
    std::size_t tasks_completed = 0;    // chunks handed to a worker
    std::size_t shutdowns_sent = 0;
    std::size_t current_size = 0;
};

/**
 * Unbounded FIFO of Tasks between the orchestrator and the worker pool.
 *
 * Single-producer order is preserved. Shutdown markers travel as ordinary
 * tasks and are told apart from chunks by variant alternative only.
 * Closing the channel is the failure path: blocked and future takers get a
 * ChannelError instead of waiting forever.
 */
class TaskChannel {
public:
    explicit TaskChannel(std::shared_ptr<Logger> logger = nullptr);

    TaskChannel(const TaskChannel&) = delete;
    TaskChannel& operator=(const TaskChannel&) = delete;

    // Enqueue one task. Throws ChannelError once the channel is closed.
    void submit(Task task);

    // Enqueue chunks in order.
    void submit_many(std::vector<Chunk> chunks);

    /**
     * Wait up to `timeout` for the next task.
     * @return the task, or std::nullopt when the timeout elapsed first
     * @throws ChannelError if the channel is (or becomes) closed
     */
    std::optional<Task> take(std::chrono::milliseconds timeout);

    // Enqueue one Shutdown marker per worker.
    void broadcast_shutdown(std::size_t worker_count);

    // Best-effort length; stale as soon as it returns under concurrency.
    std::size_t approximate_size() const;
    bool empty() const;

    void close();
    bool is_closed() const;

    ChannelStatistics statistics() const;

private:
    std::shared_ptr<Logger> logger_;
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_;

    std::atomic<std::size_t> tasks_added_;
    std::atomic<std::size_t> tasks_completed_;
    std::atomic<std::size_t> shutdowns_sent_;
};

} // namespace hashsweep
