#pragma once

#include "hashsweep/collector.hpp"
#include "hashsweep/config.hpp"
#include "hashsweep/hasher.hpp"
#include "hashsweep/logging.hpp"
#include "hashsweep/receiver.hpp"
#include "hashsweep/task_channel.hpp"
#include "hashsweep/types.hpp"
#include "hashsweep/worker_pool.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hashsweep {

// Processing and persistence are independent verdicts.
struct PipelineOutcome {
    bool processing_ok = false;
    bool persisted = false;
    std::string persistence_error;

    Report report;
    std::vector<WorkerStats> worker_stats;
    ChannelStatistics channel_stats;
    ReceiverStatistics receiver_stats;

    std::size_t items_processed = 0;
    std::size_t hash_errors = 0;
    double elapsed_seconds = 0.0;
};

/**
 * Orchestrates one sweep: chunk -> channel -> worker pool -> result store
 * -> collector. All configuration is validated in the constructor, so a
 * run never starts partially.
 */
class Pipeline {
public:
    // Throws ConfigError on invalid configuration.
    Pipeline(PipelineConfig config, std::shared_ptr<Logger> logger);

    // Same, with workers drawing their hashers from `hasher_factory`
    // instead of the configured algorithm.
    Pipeline(PipelineConfig config, std::shared_ptr<Logger> logger, HasherFactory hasher_factory);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Sweep the given candidates.
    PipelineOutcome run(const std::vector<Candidate>& candidates);

    // Read candidates from the configured CSV file first. Throws IOError on setup failure.
    PipelineOutcome run();

    // Ask idle workers of the run in progress to exit early. Every run starts
    // with a fresh token, so a request outside a run has no effect.
    void request_stop();

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    std::shared_ptr<Logger> logger_;
    HasherFactory hasher_factory_;
    std::string algorithm_;

    std::mutex stop_mutex_;
    std::shared_ptr<CancellationToken> current_stop_;
};

} // namespace hashsweep
