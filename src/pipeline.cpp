#include "hashsweep/pipeline.hpp"
#include "hashsweep/chunker.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/result_store.hpp"
#include "hashsweep/timer.hpp"

#include <chrono>

namespace hashsweep {

Pipeline::Pipeline(PipelineConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config)),
      logger_(std::move(logger)) {
    if (!logger_) {
        throw HashsweepException(ErrorCode::INVALID_ARGUMENT, "Pipeline requires a logger");
    }
    validate_config(config_);

    HashSettings settings = config_.hash_settings();
    algorithm_ = algorithm_name(settings.algorithm);
    hasher_factory_ = make_hasher_factory(settings);
}

Pipeline::Pipeline(PipelineConfig config, std::shared_ptr<Logger> logger, HasherFactory hasher_factory)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      hasher_factory_(std::move(hasher_factory)) {
    if (!logger_ || !hasher_factory_) {
        throw HashsweepException(ErrorCode::INVALID_ARGUMENT, "Pipeline requires a logger and a hasher factory");
    }
    validate_config(config_);
    algorithm_ = "custom";
}

PipelineOutcome Pipeline::run() {
    Receiver receiver(config_.input.csv_path, config_.input.csv_delimiter, logger_);
    receiver.validate_file();
    auto candidates = receiver.read_all();

    PipelineOutcome outcome = run(candidates);
    outcome.receiver_stats = receiver.statistics();
    return outcome;
}

PipelineOutcome Pipeline::run(const std::vector<Candidate>& candidates) {
    Timer timer;
    timer.start();

    const std::size_t workers = config_.general.worker_count;
    logger_->info("Starting sweep: " + std::to_string(candidates.size()) + " candidates, " +
                  std::to_string(workers) + " workers, chunk size " +
                  std::to_string(config_.general.chunk_size) + ", algorithm " + algorithm_);

    auto channel = std::make_shared<TaskChannel>(logger_);
    auto store = std::make_shared<ResultStore>();
    auto stop_token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        current_stop_ = stop_token;
    }

    WorkerPool pool(workers, channel, store, hasher_factory_, config_.hash.target_hash,
                    std::chrono::milliseconds(config_.general.worker_timeout_ms), logger_, stop_token);
    pool.start();

    bool dispatched = true;
    try {
        Chunker chunker(candidates, config_.general.chunk_size);
        logger_->debug("Dispatching " + std::to_string(chunker.chunk_count()) + " chunks");
        while (auto chunk = chunker.next()) {
            channel->submit(std::move(*chunk));
        }
        // Every chunk is queued ahead of the markers, so none can be stranded.
        pool.drain();
    } catch (const ChannelError& e) {
        logger_->critical(std::string("Task dispatch failed: ") + e.what());
        channel->close();
        dispatched = false;
    }

    PipelineOutcome outcome;
    outcome.worker_stats = pool.join();
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        current_stop_.reset();
    }
    outcome.channel_stats = channel->statistics();

    bool workers_clean = true;
    std::size_t matches_reported = 0;
    for (const auto& stats : outcome.worker_stats) {
        outcome.items_processed += stats.items_processed;
        outcome.hash_errors += stats.errors;
        matches_reported += stats.matches_found;
        if (stats.exit != WorkerExit::Shutdown) {
            workers_clean = false;
            logger_->error("Worker " + std::to_string(stats.worker_id) + " did not exit through its shutdown marker");
        }
    }

    bool store_consistent = store->size() == matches_reported;
    if (!store_consistent) {
        logger_->error("Result store holds " + std::to_string(store->size()) + " entries but workers reported " +
                       std::to_string(matches_reported) + " matches");
    }

    Collector collector(store, config_.output.results_path, logger_);
    CollectOutcome collected = collector.run(pool);
    Collector::print_results(collected.report, *logger_);

    outcome.report = std::move(collected.report);
    outcome.persisted = collected.persisted;
    outcome.persistence_error = std::move(collected.persistence_error);
    outcome.processing_ok = dispatched && workers_clean && store_consistent;
    outcome.elapsed_seconds = timer.stop();

    logger_->log_pipeline_stats(outcome.elapsed_seconds, outcome.items_processed, outcome.report.total_matches);
    if (outcome.hash_errors > 0) {
        logger_->warning("Skipped " + std::to_string(outcome.hash_errors) + " candidates after hashing errors");
    }
    return outcome;
}

void Pipeline::request_stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (current_stop_) {
        current_stop_->cancel();
    }
}

} // namespace hashsweep
