#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace hashsweep {

struct LogOptions {
    std::string log_path = "logs/hashsweep.log";
    bool verbose = true;

    bool operator==(const LogOptions& other) const {
        return log_path == other.log_path && verbose == other.verbose;
    }
    bool operator!=(const LogOptions& other) const { return !(*this == other); }
};

/**
 * Synchronized log sink shared by the whole pipeline.
 *
 * Records go to an append-only file (all levels) and, in verbose mode, to
 * stdout (info and above). Every write is serialized by an internal mutex
 * so concurrent workers never tear a record; ordering across threads follows
 * lock acquisition, not call time.
 */
class Logger {
public:
    // Independent instance, handed to components as a shared handle.
    static std::shared_ptr<Logger> create(const LogOptions& options);

    /**
     * Process-wide instance. The first caller's options win; later callers
     * receive the same instance even when their options differ. A differing
     * request is reported as a warning on the existing sink.
     */
    static std::shared_ptr<Logger> shared(const LogOptions& options = LogOptions{});

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void log_worker_start(std::size_t worker_id, const std::string& chunk_info);
    void log_worker_complete(std::size_t worker_id, double duration_seconds, std::size_t items_processed);
    void log_match_found(std::size_t worker_id, const std::string& original, const std::string& digest);
    void log_pipeline_stats(double total_seconds, std::size_t total_items, std::size_t matches_found);

    void flush();

    const LogOptions& options() const;

private:
    explicit Logger(const LogOptions& options);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace hashsweep

// Convenience macros on the process-wide instance
#define HASHSWEEP_LOG_DEBUG(msg) hashsweep::Logger::shared()->debug(msg)
#define HASHSWEEP_LOG_INFO(msg) hashsweep::Logger::shared()->info(msg)
#define HASHSWEEP_LOG_WARNING(msg) hashsweep::Logger::shared()->warning(msg)
#define HASHSWEEP_LOG_ERROR(msg) hashsweep::Logger::shared()->error(msg)
#define HASHSWEEP_LOG_CRITICAL(msg) hashsweep::Logger::shared()->critical(msg)
