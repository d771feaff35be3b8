/**
 * Aggregator Implementation
 */

#include "aggregator.hpp"

#define XXH_INLINE_ALL
#include "xxhash.h"

namespace passgram {

size_t XxHash3::operator()(const std::string& s) const noexcept {
    return static_cast<size_t>(XXH3_64bits(s.data(), s.size()));
}

bool Aggregator::add(std::string_view text) {
    stats_.input++;

    if (!bounds_.contains(text.size())) {
        stats_.out_of_range++;
        return false;
    }

    auto [it, inserted] = seen_.emplace(text);
    if (!inserted) {
        stats_.duplicates++;
        return false;
    }

    ordered_.push_back(*it);
    stats_.output = ordered_.size();
    return true;
}

std::vector<std::string> combine(const std::vector<Candidate>& deterministic,
                                 const std::vector<Candidate>& stochastic,
                                 const LengthBounds& bounds,
                                 AggregateStats* stats) {
    Aggregator aggregator(bounds);
    aggregator.add(deterministic);
    aggregator.add(stochastic);
    if (stats) *stats = aggregator.stats();
    return aggregator.take();
}

}  // namespace passgram
