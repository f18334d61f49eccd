#include "hashsweep/logging.hpp"
#include "hashsweep/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace hashsweep {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << seconds;
    return ss.str();
}

} // namespace

class Logger::Impl {
public:
    LogOptions options;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex write_mutex;

    explicit Impl(const LogOptions& opts) : options(opts) {
        std::vector<spdlog::sink_ptr> sinks;

        try {
            if (!options.log_path.empty()) {
                std::filesystem::path parent = std::filesystem::path(options.log_path).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_path, false);
                file_sink->set_level(spdlog::level::debug);
                file_sink->set_pattern("%Y-%m-%d %H:%M:%S - %l - [%P:%t] - %v");
                sinks.push_back(file_sink);
            }

            if (options.verbose) {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(spdlog::level::info);
                console_sink->set_pattern("%^%l%$ - %v");
                sinks.push_back(console_sink);
            }
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError("Cannot open log sink", options.log_path + ": " + e.what(),
                          ErrorCode::PERMISSION_DENIED);
        } catch (const std::filesystem::filesystem_error& e) {
            throw IOError("Cannot create log directory", e.what(), ErrorCode::PERMISSION_DENIED);
        }

        logger = std::make_shared<spdlog::logger>("hashsweep", sinks.begin(), sinks.end());
        logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::info);
    }

    void write(spdlog::level::level_enum level, const std::string& message) {
        std::lock_guard<std::mutex> lock(write_mutex);
        logger->log(level, message);
    }
};

std::shared_ptr<Logger> Logger::create(const LogOptions& options) {
    return std::shared_ptr<Logger>(new Logger(options));
}

std::shared_ptr<Logger> Logger::shared(const LogOptions& options) {
    static std::shared_ptr<Logger> instance = nullptr;
    static std::mutex mutex;

    std::lock_guard<std::mutex> lock(mutex);
    if (!instance) {
        instance = create(options);
        return instance;
    }

    if (instance->options() != options && options != LogOptions{}) {
        instance->warning("Logger already initialized with log_path='" + instance->options().log_path +
                          "', ignoring request for log_path='" + options.log_path + "'");
    }
    return instance;
}

Logger::Logger(const LogOptions& options) : pImpl(std::make_unique<Impl>(options)) {}

Logger::~Logger() {
    if (pImpl && pImpl->logger) {
        pImpl->logger->flush();
    }
}

void Logger::debug(const std::string& message) {
    pImpl->write(spdlog::level::debug, message);
}

void Logger::info(const std::string& message) {
    pImpl->write(spdlog::level::info, message);
}

void Logger::warning(const std::string& message) {
    pImpl->write(spdlog::level::warn, message);
}

void Logger::error(const std::string& message) {
    pImpl->write(spdlog::level::err, message);
}

void Logger::critical(const std::string& message) {
    pImpl->write(spdlog::level::critical, message);
}

void Logger::log_worker_start(std::size_t worker_id, const std::string& chunk_info) {
    info("Worker " + std::to_string(worker_id) + " started processing " + chunk_info);
}

void Logger::log_worker_complete(std::size_t worker_id, double duration_seconds, std::size_t items_processed) {
    info("Worker " + std::to_string(worker_id) + " completed: " + std::to_string(items_processed) +
         " items in " + format_seconds(duration_seconds) + "s");
}

void Logger::log_match_found(std::size_t worker_id, const std::string& original, const std::string& digest) {
    info("Worker " + std::to_string(worker_id) + " FOUND MATCH: " + original + " -> " + digest);
}

void Logger::log_pipeline_stats(double total_seconds, std::size_t total_items, std::size_t matches_found) {
    info("Pipeline completed in " + format_seconds(total_seconds) + "s");
    info("Total items processed: " + std::to_string(total_items));
    info("Matches found: " + std::to_string(matches_found));
    if (total_seconds > 0) {
        info("Processing rate: " + format_seconds(static_cast<double>(total_items) / total_seconds) +
             " items/sec");
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(pImpl->write_mutex);
    pImpl->logger->flush();
}

const LogOptions& Logger::options() const {
    return pImpl->options;
}

} // namespace hashsweep
