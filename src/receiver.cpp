#include "hashsweep/receiver.hpp"
#include "hashsweep/error.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace hashsweep {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string first_field(const std::string& line, char delimiter) {
    if (!line.empty() && line[0] == '"') {
        std::string field;
        for (std::size_t i = 1; i < line.size(); ++i) {
            if (line[i] == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    break;
                }
            } else {
                field.push_back(line[i]);
            }
        }
        return field;
    }

    auto pos = line.find(delimiter);
    return pos == std::string::npos ? line : line.substr(0, pos);
}

// True while a leading quoted field has not seen its closing quote.
bool quoted_field_open(const std::string& record) {
    if (record.empty() || record[0] != '"') {
        return false;
    }
    for (std::size_t i = 1; i < record.size(); ++i) {
        if (record[i] == '"') {
            if (i + 1 < record.size() && record[i + 1] == '"') {
                ++i;
            } else {
                return false;
            }
        }
    }
    return true;
}

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

std::vector<Candidate> parse_candidates(std::istream& input, char delimiter,
                                        ReceiverStatistics* stats, Logger* logger) {
    ReceiverStatistics local;
    ReceiverStatistics& counters = stats ? *stats : local;

    std::vector<Candidate> records;
    std::string line;
    std::size_t line_num = 0;

    while (std::getline(input, line)) {
        ++line_num;
        ++counters.total_lines;
        strip_cr(line);

        // A quoted field may span physical lines; the record ends at its closing quote.
        std::string continuation;
        while (quoted_field_open(line) && std::getline(input, continuation)) {
            ++line_num;
            strip_cr(continuation);
            line += '\n';
            line += continuation;
        }

        std::string record = trim(first_field(line, delimiter));
        if (record.empty()) {
            ++counters.invalid_lines;
            if (logger) {
                logger->debug("Empty record at line " + std::to_string(line_num));
            }
            continue;
        }

        records.push_back(std::move(record));
        ++counters.valid_lines;
    }

    return records;
}

Receiver::Receiver(std::string csv_path, char delimiter, std::shared_ptr<Logger> logger)
    : csv_path_(std::move(csv_path)), delimiter_(delimiter), logger_(std::move(logger)) {}

void Receiver::validate_file() const {
    std::error_code ec;
    if (!std::filesystem::exists(csv_path_, ec)) {
        throw IOError("CSV file not found", csv_path_);
    }
    if (!std::filesystem::is_regular_file(csv_path_, ec)) {
        throw IOError("Path is not a file", csv_path_);
    }
    std::ifstream probe(csv_path_);
    if (!probe) {
        throw IOError("No read permission for file", csv_path_, ErrorCode::PERMISSION_DENIED);
    }
}

std::vector<Candidate> Receiver::read_all() {
    std::ifstream file(csv_path_);
    if (!file) {
        throw IOError("Cannot open CSV file", csv_path_);
    }

    stats_ = ReceiverStatistics{};
    auto records = parse_candidates(file, delimiter_, &stats_, logger_.get());

    if (file.bad()) {
        throw IOError("Error reading CSV file", csv_path_);
    }

    if (logger_) {
        logger_->info("Loaded " + std::to_string(stats_.valid_lines) + " valid records from " + csv_path_);
        if (stats_.invalid_lines > 0) {
            logger_->warning("Skipped " + std::to_string(stats_.invalid_lines) + " invalid lines");
        }
    }
    return records;
}

} // namespace hashsweep
