#pragma once

#include "hashsweep/types.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hashsweep {

// Globally unique by construction: each worker numbers its own matches.
struct ResultKey {
    std::size_t worker_id = 0;
    std::uint64_t sequence = 0;

    bool operator==(const ResultKey& other) const = default;

    std::string to_string() const {
        return "match_" + std::to_string(worker_id) + "_" + std::to_string(sequence);
    }
};

struct ResultKeyHash {
    std::size_t operator()(const ResultKey& key) const noexcept {
        std::size_t h = std::hash<std::size_t>{}(key.worker_id);
        return h ^ (std::hash<std::uint64_t>{}(key.sequence) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/**
 * Append-only concurrent map of discovered matches.
 *
 * Keys are spread over independently locked shards so workers rarely contend.
 * There is no update or erase. snapshot() is meant for the single reader
 * that runs after every writer has been joined.
 */
class ResultStore {
public:
    static constexpr std::size_t SHARD_COUNT = 16;

    ResultStore() : size_(0) {}

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    // Atomic insert-if-absent. Returns false if the key was already present.
    bool insert(const ResultKey& key, MatchResult result);

    bool contains(const ResultKey& key) const;

    std::size_t size() const { return size_.load(std::memory_order_acquire); }
    bool empty() const { return size() == 0; }

    std::vector<std::pair<ResultKey, MatchResult>> snapshot() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<ResultKey, MatchResult, ResultKeyHash> entries;
    };

    Shard& shard_for(const ResultKey& key) {
        return shards_[ResultKeyHash{}(key) % SHARD_COUNT];
    }
    const Shard& shard_for(const ResultKey& key) const {
        return shards_[ResultKeyHash{}(key) % SHARD_COUNT];
    }

    std::array<Shard, SHARD_COUNT> shards_;
    std::atomic<std::size_t> size_;
};

} // namespace hashsweep
