#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace hashsweep {

// =============================================================================
// Work units
// =============================================================================

using Candidate = std::string;

// Non-empty, ordered batch of candidates; at most the configured chunk size.
using Chunk = std::vector<Candidate>;

// Termination request for exactly one worker. Carries no payload.
struct Shutdown {};

using Task = std::variant<Chunk, Shutdown>;

// Visitor built from one lambda per Task alternative.
template<typename... Handlers>
struct TaskVisitor : Handlers... {
    using Handlers::operator()...;
};
template<typename... Handlers>
TaskVisitor(Handlers...) -> TaskVisitor<Handlers...>;

// =============================================================================
// Results
// =============================================================================

struct MatchResult {
    std::size_t worker_id = 0;
    std::string original;
    std::string hash;
    std::string algorithm;
    std::uint64_t sequence = 0;   // per-worker discovery order, starting at 1

    bool operator==(const MatchResult& other) const = default;
};

enum class WorkerExit {
    Shutdown,           // consumed its Shutdown marker
    Stopped,            // external stop observed while idle
    ChannelFailure,     // channel closed or broken under it
    Failed              // unexpected error escaped the loop
};

struct WorkerStats {
    std::size_t worker_id = 0;
    std::size_t items_processed = 0;    // candidates hashed successfully
    std::size_t matches_found = 0;
    std::size_t errors = 0;             // candidates skipped after a hashing error
    std::chrono::duration<double> elapsed{0};
    WorkerExit exit = WorkerExit::Shutdown;
};

} // namespace hashsweep
