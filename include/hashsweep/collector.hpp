#pragma once

#include "hashsweep/logging.hpp"
#include "hashsweep/result_store.hpp"
#include "hashsweep/types.hpp"

#include <boost/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace hashsweep {

class WorkerPool;

struct Report {
    std::size_t total_matches = 0;
    std::vector<MatchResult> matches;   // ordered by (worker_id, original)
};

// {total_matches, matches:[{worker_id, original, hash, algorithm}, ...]}
boost::json::object report_to_json(const Report& report);

// Two-space indented rendering of a JSON value.
std::string pretty_json(const boost::json::value& value);

struct CollectOutcome {
    Report report;
    bool persisted = false;
    std::string persistence_error;
};

/**
 * Single reader that turns the result store into the final report.
 *
 * Must only run once every writer has finished; run() enforces this by
 * requiring the pool to be Terminated. Persistence failures are logged and
 * reported in the outcome, never thrown.
 */
class Collector {
public:
    Collector(std::shared_ptr<const ResultStore> store, std::string results_path,
              std::shared_ptr<Logger> logger);

    // Snapshot and order every stored match.
    Report collect() const;

    // Write `report` to the results path. Returns false (and sets `error`) on failure.
    bool persist(const Report& report, std::string* error = nullptr) const;

    // collect() + persist(). Throws std::logic_error unless `pool` is Terminated.
    CollectOutcome run(const WorkerPool& pool) const;

    static void print_results(const Report& report, Logger& logger);

private:
    std::shared_ptr<const ResultStore> store_;
    std::string results_path_;
    std::shared_ptr<Logger> logger_;
};

} // namespace hashsweep
