/**
 * Beam Generator Implementation
 */

#include "beam_generator.hpp"
#include <algorithm>
#include <future>

namespace passgram {
namespace pcfg {

namespace {

// Higher score first; equal scores fall back to lexicographic text order
template <typename T>
bool ranks_before(const T& a, const T& b, double score_a, double score_b) {
    if (score_a != score_b) return score_a > score_b;
    return a.text < b.text;
}

}  // namespace

BeamGenerator::BeamGenerator(const Scorer& scorer, const GenerationConfig& config)
    : scorer_(scorer), config_(config) {
    validate(config_);
}

std::vector<const RankedTemplate*> BeamGenerator::select_templates() const {
    std::vector<const RankedTemplate*> selected;
    for (const auto& ranked : scorer_.model().ranked_templates()) {
        if (selected.size() >= config_.beam.topk_templates) break;
        if (!config_.bounds.contains(ranked.tmpl.total_length())) continue;
        selected.push_back(&ranked);
    }
    return selected;
}

BeamGenerator::TemplateResult BeamGenerator::expand(const RankedTemplate& ranked) const {
    const PCFGModel& model = scorer_.model();
    TemplateResult result;

    auto better = [](const Partial& a, const Partial& b) {
        return ranks_before(a, b, a.score, b.score);
    };

    std::vector<Partial> beam{{"", model.template_log_prob(ranked.label)}};

    for (const auto& slot : ranked.tmpl.slots) {
        const auto& values = model.ranked_tokens(slot.type, slot.length);
        size_t topk = std::min(values.size(), config_.beam.topk_per_slot);
        if (topk == 0) return result;  // Trimmed away; nothing can fill this slot

        std::vector<Partial> next;
        next.reserve(beam.size() * topk);
        for (const auto& partial : beam) {
            for (size_t i = 0; i < topk; ++i) {
                next.push_back({partial.text + values[i].value,
                                partial.score + model.token_log_prob(slot.type, values[i].value)});
            }
        }

        if (next.size() > config_.beam.width) {
            std::nth_element(next.begin(), next.begin() + config_.beam.width, next.end(), better);
            result.pruned += next.size() - config_.beam.width;
            next.resize(config_.beam.width);
        }
        beam = std::move(next);
    }

    // Re-score survivors with the full scorer and drop those that would
    // tokenize as a different template (e.g. leet folding across a slot).
    result.candidates.reserve(beam.size());
    for (auto& partial : beam) {
        ScoredParse scored = scorer_.score_parse(partial.text);
        if (scored.parse.tmpl != ranked.tmpl) {
            result.rejected++;
            continue;
        }
        result.candidates.push_back({std::move(partial.text), CandidateSource::DETERMINISTIC, scored.score});
    }

    std::sort(result.candidates.begin(), result.candidates.end(),
              [](const Candidate& a, const Candidate& b) {
                  return ranks_before(a, b, *a.score, *b.score);
              });
    if (result.candidates.size() > config_.beam.max_per_template) {
        result.candidates.resize(config_.beam.max_per_template);
    }

    return result;
}

bool BeamGenerator::absorb(TemplateResult&& result, std::vector<Candidate>& out) {
    stats_.templates_expanded++;
    stats_.partials_pruned += result.pruned;
    stats_.rejected += result.rejected;

    for (auto& candidate : result.candidates) {
        if (out.size() >= config_.beam.max_total) return false;
        out.push_back(std::move(candidate));
    }
    stats_.emitted = out.size();
    return out.size() < config_.beam.max_total;
}

std::vector<Candidate> BeamGenerator::generate() {
    stats_ = BeamStats{};
    std::vector<Candidate> out;
    if (config_.beam.max_total == 0) return out;

    auto templates = select_templates();

    if (config_.beam.threads <= 1) {
        for (const auto* ranked : templates) {
            if (!absorb(expand(*ranked), out)) break;
        }
        stats_.emitted = out.size();
        return out;
    }

    // Template beams are independent; expand a batch concurrently, then merge
    // in rank order so the result does not depend on scheduling.
    for (size_t begin = 0; begin < templates.size(); begin += config_.beam.threads) {
        size_t end = std::min(templates.size(), begin + config_.beam.threads);

        std::vector<std::future<TemplateResult>> pending;
        pending.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            pending.push_back(std::async(std::launch::async,
                                         [this, ranked = templates[i]] { return expand(*ranked); }));
        }

        bool more = true;
        for (auto& future : pending) {
            TemplateResult result = future.get();
            if (more) more = absorb(std::move(result), out);
        }
        if (!more) break;
    }

    stats_.emitted = out.size();
    return out;
}

std::vector<Candidate> generate_deterministic(const Scorer& scorer, const GenerationConfig& config) {
    BeamGenerator generator(scorer, config);
    return generator.generate();
}

std::vector<Candidate> generate_deterministic(const PCFGModel& model, const GenerationConfig& config) {
    Scorer scorer(model);
    return generate_deterministic(scorer, config);
}

}  // namespace pcfg
}  // namespace passgram
