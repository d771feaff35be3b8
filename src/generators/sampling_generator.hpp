/**
 * passgram Sampling Generator
 *
 * Stochastic candidate generation: draw a template proportional to its
 * frequency, then one value per slot proportional to its frequency.
 * Fully reproducible for a fixed seed; duplicates are left to the aggregator.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../pcfg/model.hpp"
#include "../pcfg/scorer.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <utility>
#include <vector>

namespace passgram {
namespace pcfg {

struct SamplingStats {
    size_t draws = 0;
    size_t unfillable = 0;    // Draws whose template had a slot with no values
    size_t emitted = 0;
};

class SamplingGenerator {
public:
    /**
     * Builds the cumulative weight tables once; the generator can then be
     * run repeatedly with different seeds.
     */
    SamplingGenerator(const Scorer& scorer, const SamplingConfig& config);

    /**
     * Exactly config.num_samples draws (minus unfillable ones), in draw order.
     */
    std::vector<Candidate> generate(uint64_t seed);
    std::vector<Candidate> generate() { return generate(config_.seed); }

    const SamplingStats& stats() const { return stats_; }

private:
    /**
     * Cumulative counts in ranked order; draw r in [0, total) and take the
     * first entry whose cumulative count exceeds r.
     */
    struct WeightTable {
        std::vector<uint64_t> cumulative;

        uint64_t total() const { return cumulative.empty() ? 0 : cumulative.back(); }
        size_t draw(std::mt19937_64& rng) const;
    };

    const Scorer& scorer_;
    SamplingConfig config_;
    SamplingStats stats_;

    WeightTable templates_;
    std::map<std::pair<TokenType, size_t>, WeightTable> slot_tables_;

    const WeightTable* slot_table(const Slot& slot) const;
};

std::vector<Candidate> generate_stochastic(const Scorer& scorer, const SamplingConfig& config, uint64_t seed);

/**
 * Convenience form for a model trained without a vocabulary.
 */
std::vector<Candidate> generate_stochastic(const PCFGModel& model, const SamplingConfig& config, uint64_t seed);

}  // namespace pcfg
}  // namespace passgram
