#include "hashsweep/task_channel.hpp"
#include "hashsweep/error.hpp"

#include <string>
#include <utility>

namespace hashsweep {

TaskChannel::TaskChannel(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)),
      closed_(false),
      tasks_added_(0),
      tasks_completed_(0),
      shutdowns_sent_(0) {}

void TaskChannel::submit(Task task) {
    bool is_chunk = std::holds_alternative<Chunk>(task);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw ChannelError("submit on closed channel");
        }
        queue_.push_back(std::move(task));
    }
    if (is_chunk) {
        tasks_added_.fetch_add(1, std::memory_order_relaxed);
    } else {
        shutdowns_sent_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
}

void TaskChannel::submit_many(std::vector<Chunk> chunks) {
    std::size_t count = chunks.size();
    for (auto& chunk : chunks) {
        submit(Task{std::move(chunk)});
    }
    if (logger_) {
        logger_->debug("Added " + std::to_string(count) + " tasks to queue");
    }
}

std::optional<Task> TaskChannel::take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });

    if (closed_) {
        throw ChannelError("take on closed channel");
    }
    if (!ready) {
        return std::nullopt;
    }

    Task task = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();

    if (std::holds_alternative<Chunk>(task)) {
        tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    }
    return task;
}

void TaskChannel::broadcast_shutdown(std::size_t worker_count) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw ChannelError("broadcast_shutdown on closed channel");
        }
        for (std::size_t i = 0; i < worker_count; ++i) {
            queue_.emplace_back(Shutdown{});
        }
    }
    shutdowns_sent_.fetch_add(worker_count, std::memory_order_relaxed);
    cv_.notify_all();

    if (logger_) {
        logger_->debug("Sent " + std::to_string(worker_count) + " shutdown markers");
    }
}

std::size_t TaskChannel::approximate_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskChannel::empty() const {
    return approximate_size() == 0;
}

void TaskChannel::close() {
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();

    if (logger_) {
        logger_->warning("Task channel closed with " + std::to_string(discarded) + " pending tasks");
    }
}

bool TaskChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

ChannelStatistics TaskChannel::statistics() const {
    ChannelStatistics stats;
    stats.tasks_added = tasks_added_.load(std::memory_order_relaxed);
    stats.tasks_completed = tasks_completed_.load(std::memory_order_relaxed);
    stats.shutdowns_sent = shutdowns_sent_.load(std::memory_order_relaxed);
    stats.current_size = approximate_size();
    return stats;
}

} // namespace hashsweep
