/**
 * Sampling Generator Implementation
 */

#include "sampling_generator.hpp"
#include <algorithm>

namespace passgram {
namespace pcfg {

size_t SamplingGenerator::WeightTable::draw(std::mt19937_64& rng) const {
    std::uniform_int_distribution<uint64_t> dist(0, total() - 1);
    uint64_t r = dist(rng);
    auto it = std::upper_bound(cumulative.begin(), cumulative.end(), r);
    return static_cast<size_t>(it - cumulative.begin());
}

SamplingGenerator::SamplingGenerator(const Scorer& scorer, const SamplingConfig& config)
    : scorer_(scorer), config_(config) {
    const PCFGModel& model = scorer_.model();

    uint64_t running = 0;
    for (const auto& ranked : model.ranked_templates()) {
        running += ranked.count;
        templates_.cumulative.push_back(running);

        for (const auto& slot : ranked.tmpl.slots) {
            auto key = std::make_pair(slot.type, slot.length);
            if (slot_tables_.count(key)) continue;

            WeightTable table;
            uint64_t slot_running = 0;
            for (const auto& token : model.ranked_tokens(slot.type, slot.length)) {
                slot_running += token.count;
                table.cumulative.push_back(slot_running);
            }
            slot_tables_.emplace(key, std::move(table));
        }
    }
}

const SamplingGenerator::WeightTable* SamplingGenerator::slot_table(const Slot& slot) const {
    auto it = slot_tables_.find(std::make_pair(slot.type, slot.length));
    if (it == slot_tables_.end() || it->second.total() == 0) return nullptr;
    return &it->second;
}

std::vector<Candidate> SamplingGenerator::generate(uint64_t seed) {
    stats_ = SamplingStats{};
    std::vector<Candidate> out;
    if (templates_.total() == 0) return out;

    const PCFGModel& model = scorer_.model();
    const auto& ranked_templates = model.ranked_templates();
    std::mt19937_64 rng(seed);
    out.reserve(config_.num_samples);

    for (size_t n = 0; n < config_.num_samples; ++n) {
        stats_.draws++;
        const RankedTemplate& ranked = ranked_templates[templates_.draw(rng)];

        std::string text;
        bool filled = true;
        for (const auto& slot : ranked.tmpl.slots) {
            const WeightTable* table = slot_table(slot);
            if (!table) {
                filled = false;
                break;
            }
            text += model.ranked_tokens(slot.type, slot.length)[table->draw(rng)].value;
        }

        if (!filled) {
            stats_.unfillable++;
            continue;
        }

        double score = scorer_.score(text);
        out.push_back({std::move(text), CandidateSource::STOCHASTIC, score});
    }

    stats_.emitted = out.size();
    return out;
}

std::vector<Candidate> generate_stochastic(const Scorer& scorer, const SamplingConfig& config, uint64_t seed) {
    SamplingGenerator generator(scorer, config);
    return generator.generate(seed);
}

std::vector<Candidate> generate_stochastic(const PCFGModel& model, const SamplingConfig& config, uint64_t seed) {
    Scorer scorer(model);
    return generate_stochastic(scorer, config, seed);
}

}  // namespace pcfg
}  // namespace passgram
