#include "hashsweep/result_store.hpp"

namespace hashsweep {

bool ResultStore::insert(const ResultKey& key, MatchResult result) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto [it, inserted] = shard.entries.try_emplace(key, std::move(result));
    if (inserted) {
        size_.fetch_add(1, std::memory_order_release);
    }
    return inserted;
}

bool ResultStore::contains(const ResultKey& key) const {
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.find(key) != shard.entries.end();
}

std::vector<std::pair<ResultKey, MatchResult>> ResultStore::snapshot() const {
    std::vector<std::pair<ResultKey, MatchResult>> entries;
    entries.reserve(size());
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.entries) {
            entries.emplace_back(entry.first, entry.second);
        }
    }
    return entries;
}

} // namespace hashsweep
