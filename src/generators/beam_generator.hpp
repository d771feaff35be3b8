/**
 * passgram Beam Generator
 *
 * Deterministic candidate generation: fixed-width beam search over the most
 * frequent templates and token values. A greedy approximation to full
 * enumeration; identical output for identical model and config.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../pcfg/model.hpp"
#include "../pcfg/scorer.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace passgram {
namespace pcfg {

struct BeamStats {
    size_t templates_expanded = 0;
    size_t partials_pruned = 0;
    size_t rejected = 0;      // Survivors that re-parse to another template
    size_t emitted = 0;
};

class BeamGenerator {
public:
    /**
     * @throws ConfigError on invalid configuration
     */
    BeamGenerator(const Scorer& scorer, const GenerationConfig& config);

    /**
     * Candidates grouped by template rank, each group ordered by score desc
     * (ties by text), never more than config.beam.max_total in total.
     */
    std::vector<Candidate> generate();

    /**
     * Templates that will be expanded, in order: count desc (ties by label),
     * fixed length inside the configured bounds, at most topk_templates.
     */
    std::vector<const RankedTemplate*> select_templates() const;

    const BeamStats& stats() const { return stats_; }

private:
    struct Partial {
        std::string text;
        double score;
    };

    struct TemplateResult {
        std::vector<Candidate> candidates;
        size_t pruned = 0;
        size_t rejected = 0;
    };

    const Scorer& scorer_;
    GenerationConfig config_;
    BeamStats stats_;

    TemplateResult expand(const RankedTemplate& ranked) const;
    bool absorb(TemplateResult&& result, std::vector<Candidate>& out);
};

std::vector<Candidate> generate_deterministic(const Scorer& scorer, const GenerationConfig& config);

/**
 * Convenience form for a model trained without a vocabulary.
 */
std::vector<Candidate> generate_deterministic(const PCFGModel& model, const GenerationConfig& config);

}  // namespace pcfg
}  // namespace passgram
