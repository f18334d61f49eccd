#include "hashsweep/collector.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/worker_pool.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <tuple>

namespace hashsweep {

namespace {

void pretty_print(std::ostream& os, const boost::json::value& value, std::string& indent) {
    switch (value.kind()) {
        case boost::json::kind::object: {
            const auto& obj = value.get_object();
            if (obj.empty()) {
                os << "{}";
                break;
            }
            os << "{\n";
            indent.append(2, ' ');
            auto it = obj.begin();
            for (;;) {
                os << indent << boost::json::serialize(it->key()) << ": ";
                pretty_print(os, it->value(), indent);
                if (++it == obj.end()) break;
                os << ",\n";
            }
            os << "\n";
            indent.resize(indent.size() - 2);
            os << indent << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = value.get_array();
            if (arr.empty()) {
                os << "[]";
                break;
            }
            os << "[\n";
            indent.append(2, ' ');
            auto it = arr.begin();
            for (;;) {
                os << indent;
                pretty_print(os, *it, indent);
                if (++it == arr.end()) break;
                os << ",\n";
            }
            os << "\n";
            indent.resize(indent.size() - 2);
            os << indent << "]";
            break;
        }
        default:
            os << boost::json::serialize(value);
            break;
    }
}

} // namespace

boost::json::object report_to_json(const Report& report) {
    boost::json::array matches;
    for (const auto& match : report.matches) {
        matches.push_back(boost::json::object{
            {"worker_id", match.worker_id},
            {"original", match.original},
            {"hash", match.hash},
            {"algorithm", match.algorithm}
        });
    }

    boost::json::object document;
    document["total_matches"] = report.total_matches;
    document["matches"] = std::move(matches);
    return document;
}

std::string pretty_json(const boost::json::value& value) {
    std::ostringstream os;
    std::string indent;
    pretty_print(os, value, indent);
    os << "\n";
    return os.str();
}

Collector::Collector(std::shared_ptr<const ResultStore> store, std::string results_path,
                     std::shared_ptr<Logger> logger)
    : store_(std::move(store)), results_path_(std::move(results_path)), logger_(std::move(logger)) {}

Report Collector::collect() const {
    Report report;
    auto entries = store_->snapshot();
    report.matches.reserve(entries.size());
    for (auto& entry : entries) {
        report.matches.push_back(std::move(entry.second));
    }

    // Sequence breaks ties between identical candidates found by one worker.
    std::sort(report.matches.begin(), report.matches.end(),
              [](const MatchResult& a, const MatchResult& b) {
                  return std::tie(a.worker_id, a.original, a.sequence) <
                         std::tie(b.worker_id, b.original, b.sequence);
              });
    report.total_matches = report.matches.size();
    return report;
}

bool Collector::persist(const Report& report, std::string* error) const {
    try {
        std::filesystem::path parent = std::filesystem::path(results_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw IOError("Cannot create results directory", parent.string() + ": " + ec.message(),
                              ErrorCode::WRITE_FAILED);
            }
        }

        std::ofstream out(results_path_, std::ios::trunc);
        if (!out) {
            throw IOError("Cannot open results file for writing", results_path_, ErrorCode::WRITE_FAILED);
        }
        out << pretty_json(report_to_json(report));
        out.flush();
        if (!out) {
            throw IOError("Write to results file failed", results_path_, ErrorCode::WRITE_FAILED);
        }
    } catch (const std::exception& e) {
        logger_->error(std::string("Error saving results: ") + e.what());
        if (error) {
            *error = e.what();
        }
        return false;
    }

    logger_->info("Saved " + std::to_string(report.total_matches) + " results to " + results_path_);
    return true;
}

CollectOutcome Collector::run(const WorkerPool& pool) const {
    if (pool.state() != PoolState::Terminated) {
        throw std::logic_error(std::string("Collector cannot run while pool is ") + to_string(pool.state()));
    }

    logger_->info("Collector started");

    CollectOutcome outcome;
    outcome.report = collect();
    outcome.persisted = persist(outcome.report, &outcome.persistence_error);

    logger_->info("Collector finished");
    return outcome;
}

void Collector::print_results(const Report& report, Logger& logger) {
    if (report.matches.empty()) {
        logger.info("No matches found");
        return;
    }

    const std::string rule(60, '=');
    logger.info(rule);
    logger.info("MATCHES FOUND: " + std::to_string(report.total_matches));
    logger.info(rule);

    std::size_t index = 1;
    for (const auto& match : report.matches) {
        logger.info("Match #" + std::to_string(index++) + ":");
        logger.info("  Worker ID:  " + std::to_string(match.worker_id));
        logger.info("  Original:   " + match.original);
        logger.info("  Hash:       " + match.hash);
        logger.info("  Algorithm:  " + match.algorithm);
    }

    logger.info(rule);
}

} // namespace hashsweep
