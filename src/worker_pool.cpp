#include "hashsweep/worker_pool.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/timer.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace hashsweep {

// =============================================================================
// Worker
// =============================================================================

Worker::Worker(std::size_t worker_id,
               std::shared_ptr<TaskChannel> channel,
               std::shared_ptr<ResultStore> store,
               std::unique_ptr<Hasher> hasher,
               const std::string& target_hash,
               std::chrono::milliseconds take_timeout,
               std::shared_ptr<Logger> logger,
               std::shared_ptr<const CancellationToken> stop_token)
    : channel_(std::move(channel)),
      store_(std::move(store)),
      hasher_(std::move(hasher)),
      target_hash_(normalize_digest(target_hash)),
      take_timeout_(take_timeout),
      logger_(std::move(logger)),
      stop_token_(std::move(stop_token)) {
    if (!channel_ || !store_ || !hasher_ || !logger_) {
        throw HashsweepException(ErrorCode::INVALID_ARGUMENT, "Worker requires channel, store, hasher and logger");
    }
    stats_.worker_id = worker_id;
}

WorkerStats Worker::run() {
    const std::size_t id = stats_.worker_id;
    logger_->log_worker_start(id, "waiting for tasks");

    Timer timer;
    timer.start();

    try {
        bool running = true;
        while (running) {
            std::optional<Task> task = channel_->take(take_timeout_);

            if (!task) {
                if (stop_token_ && stop_token_->is_cancelled()) {
                    logger_->warning("Worker " + std::to_string(id) + " observed stop request while idle");
                    stats_.exit = WorkerExit::Stopped;
                    running = false;
                }
                continue;
            }

            running = std::visit(TaskVisitor{
                [this](const Chunk& chunk) {
                    process_chunk(chunk);
                    return true;
                },
                [this, id](const Shutdown&) {
                    logger_->debug("Worker " + std::to_string(id) + " received shutdown marker");
                    stats_.exit = WorkerExit::Shutdown;
                    return false;
                }
            }, *task);
        }
    } catch (const ChannelError& e) {
        logger_->error("Worker " + std::to_string(id) + " lost its task channel: " + e.what());
        stats_.exit = WorkerExit::ChannelFailure;
    } catch (const std::exception& e) {
        logger_->critical("Worker " + std::to_string(id) + " failed: " + e.what());
        stats_.exit = WorkerExit::Failed;
    }

    stats_.elapsed = std::chrono::duration<double>(timer.stop());
    logger_->log_worker_complete(id, stats_.elapsed.count(), stats_.items_processed);
    return stats_;
}

void Worker::process_chunk(const Chunk& chunk) {
    for (const auto& candidate : chunk) {
        std::string digest;
        try {
            digest = hasher_->digest(candidate);
        } catch (const std::exception& e) {
            ++stats_.errors;
            logger_->error("Worker " + std::to_string(stats_.worker_id) + " error processing '" +
                           candidate + "': " + e.what());
            continue;
        }

        ++stats_.items_processed;
        if (!target_hash_.empty() && normalize_digest(digest) == target_hash_) {
            record_match(candidate, digest);
        }
    }
}

void Worker::record_match(const Candidate& candidate, const std::string& digest) {
    ResultKey key{stats_.worker_id, stats_.matches_found + 1};

    MatchResult result;
    result.worker_id = stats_.worker_id;
    result.original = candidate;
    result.hash = digest;
    result.algorithm = hasher_->algorithm();
    result.sequence = key.sequence;

    if (!store_->insert(key, std::move(result))) {
        logger_->error("Duplicate result key " + key.to_string() + ", match not recorded");
        return;
    }
    ++stats_.matches_found;
    logger_->log_match_found(stats_.worker_id, candidate, digest);
}

// =============================================================================
// WorkerPool
// =============================================================================

const char* to_string(PoolState state) {
    switch (state) {
        case PoolState::Idle:       return "Idle";
        case PoolState::Running:    return "Running";
        case PoolState::Draining:   return "Draining";
        case PoolState::Terminated: return "Terminated";
    }
    return "Unknown";
}

WorkerPool::WorkerPool(std::size_t worker_count,
                       std::shared_ptr<TaskChannel> channel,
                       std::shared_ptr<ResultStore> store,
                       HasherFactory hasher_factory,
                       std::string target_hash,
                       std::chrono::milliseconds take_timeout,
                       std::shared_ptr<Logger> logger,
                       std::shared_ptr<CancellationToken> stop_token)
    : worker_count_(worker_count),
      channel_(std::move(channel)),
      store_(std::move(store)),
      hasher_factory_(std::move(hasher_factory)),
      target_hash_(std::move(target_hash)),
      take_timeout_(take_timeout),
      logger_(std::move(logger)),
      stop_token_(stop_token ? std::move(stop_token) : std::make_shared<CancellationToken>()),
      state_(PoolState::Idle),
      active_(0) {
    if (worker_count_ == 0) {
        throw ConfigError("worker_count must be at least 1");
    }
}

WorkerPool::~WorkerPool() {
    PoolState current = state();
    if (current == PoolState::Running || current == PoolState::Draining) {
        request_stop();
        channel_->close();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
}

void WorkerPool::start() {
    if (state() != PoolState::Idle) {
        throw std::logic_error(std::string("WorkerPool::start in state ") + to_string(state()));
    }

    // Build every hasher first so a bad factory fails before any thread runs.
    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers.push_back(std::make_unique<Worker>(i, channel_, store_, hasher_factory_(), target_hash_,
                                                   take_timeout_, logger_, stop_token_));
    }

    stats_.assign(worker_count_, WorkerStats{});
    threads_.reserve(worker_count_);
    active_.store(worker_count_, std::memory_order_release);
    state_.store(PoolState::Running, std::memory_order_release);

    for (std::size_t i = 0; i < worker_count_; ++i) {
        threads_.emplace_back([this, i, worker = std::move(workers[i])]() {
            stats_[i] = worker->run();
            active_.fetch_sub(1, std::memory_order_acq_rel);
        });
    }

    logger_->info("Started " + std::to_string(worker_count_) + " workers");
}

void WorkerPool::drain() {
    if (state() != PoolState::Running) {
        throw std::logic_error(std::string("WorkerPool::drain in state ") + to_string(state()));
    }
    channel_->broadcast_shutdown(worker_count_);
    state_.store(PoolState::Draining, std::memory_order_release);
}

std::vector<WorkerStats> WorkerPool::join() {
    PoolState current = state();
    if (current != PoolState::Running && current != PoolState::Draining) {
        throw std::logic_error(std::string("WorkerPool::join in state ") + to_string(current));
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    state_.store(PoolState::Terminated, std::memory_order_release);

    logger_->debug("All " + std::to_string(worker_count_) + " workers terminated");
    return stats_;
}

void WorkerPool::request_stop() {
    stop_token_->cancel();
}

} // namespace hashsweep
