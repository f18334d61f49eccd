#pragma once

#include "hashsweep/error.hpp"
#include "hashsweep/types.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <vector>

namespace hashsweep {

/**
 * Lazy splitter of an ordered candidate sequence into bounded chunks.
 *
 * Produces ceil(N / chunk_size) chunks in input order; only the last one may
 * be short. An empty input yields no chunks. The chunker views the caller's
 * storage, which must outlive it. Restart by constructing a new chunker.
 */
class Chunker {
public:
    Chunker(std::span<const Candidate> candidates, std::size_t chunk_size)
        : candidates_(candidates), chunk_size_(chunk_size), offset_(0) {
        if (chunk_size_ == 0) {
            throw ConfigError("chunk_size must be at least 1");
        }
    }

    std::optional<Chunk> next() {
        if (offset_ >= candidates_.size()) {
            return std::nullopt;
        }
        std::size_t end = std::min(offset_ + chunk_size_, candidates_.size());
        Chunk chunk(candidates_.begin() + offset_, candidates_.begin() + end);
        offset_ = end;
        return chunk;
    }

    std::size_t chunk_count() const {
        return (candidates_.size() + chunk_size_ - 1) / chunk_size_;
    }

    std::size_t chunk_size() const { return chunk_size_; }

    // Materialize every chunk at once.
    static std::vector<Chunk> chunk_list(std::span<const Candidate> candidates, std::size_t chunk_size) {
        Chunker chunker(candidates, chunk_size);
        std::vector<Chunk> chunks;
        chunks.reserve(chunker.chunk_count());
        while (auto chunk = chunker.next()) {
            chunks.push_back(std::move(*chunk));
        }
        return chunks;
    }

private:
    std::span<const Candidate> candidates_;
    std::size_t chunk_size_;
    std::size_t offset_;
};

} // namespace hashsweep
