/**
 * passgram Aggregator
 *
 * Merges candidate streams into the final ordered artifact: first occurrence
 * wins, duplicates and out-of-range lengths are dropped.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace passgram {

/**
 * XXH3-64 string hash for the dedup set.
 */
struct XxHash3 {
    size_t operator()(const std::string& s) const noexcept;
};

struct AggregateStats {
    size_t input = 0;
    size_t duplicates = 0;
    size_t out_of_range = 0;
    size_t output = 0;
};

/**
 * Order-preserving exact deduplication with a length filter.
 * Feed sources in priority order; results keep first-seen order.
 */
class Aggregator {
public:
    explicit Aggregator(const LengthBounds& bounds) : bounds_(bounds) {}

    /**
     * @return true if the string was kept
     */
    bool add(std::string_view text);

    void add(const std::vector<Candidate>& candidates) {
        for (const auto& candidate : candidates) {
            add(candidate.text);
        }
    }

    const std::vector<std::string>& result() const { return ordered_; }
    std::vector<std::string> take() { return std::move(ordered_); }

    const AggregateStats& stats() const { return stats_; }

private:
    LengthBounds bounds_;
    std::unordered_set<std::string, XxHash3> seen_;
    std::vector<std::string> ordered_;
    AggregateStats stats_;
};

/**
 * Deterministic candidates first, then stochastic.
 */
std::vector<std::string> combine(const std::vector<Candidate>& deterministic,
                                 const std::vector<Candidate>& stochastic,
                                 const LengthBounds& bounds,
                                 AggregateStats* stats = nullptr);

}  // namespace passgram
