#pragma once

#include "hashsweep/logging.hpp"
#include "hashsweep/types.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace hashsweep {

// Counted per CSV record; a quoted field spanning several lines is one record.
struct ReceiverStatistics {
    std::size_t total_lines = 0;
    std::size_t valid_lines = 0;
    std::size_t invalid_lines = 0;
};

/**
 * CSV candidate source. The candidate is the first column of each row with
 * surrounding whitespace removed; rows without one are skipped and counted.
 * Quoted fields are unquoted, with "" as an escaped quote; a quoted field
 * may contain the delimiter and line breaks.
 */
class Receiver {
public:
    Receiver(std::string csv_path, char delimiter, std::shared_ptr<Logger> logger);

    // Throws IOError if the path is missing, not a regular file, or unreadable.
    void validate_file() const;

    // Reads every valid candidate in file order. Throws IOError on open failure.
    std::vector<Candidate> read_all();

    const ReceiverStatistics& statistics() const { return stats_; }

private:
    std::string csv_path_;
    char delimiter_;
    std::shared_ptr<Logger> logger_;
    ReceiverStatistics stats_;
};

// In-memory variant used by the HTTP adapter; `stats` may be null.
std::vector<Candidate> parse_candidates(std::istream& input, char delimiter,
                                        ReceiverStatistics* stats = nullptr,
                                        Logger* logger = nullptr);

} // namespace hashsweep
