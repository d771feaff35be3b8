/**
 * Generator Tests
 *
 * Deterministic beam search and seeded weighted sampling.
 */

#include "../src/generators/beam_generator.hpp"
#include "../src/generators/sampling_generator.hpp"
#include "../src/pcfg/trainer.hpp"
#include "../src/core/errors.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace passgram;
using namespace passgram::pcfg;

PCFGModel scenario_model() {
    return fit(std::vector<std::string>{"password1", "Password2", "letme1n"});
}

/**
 * A corpus with enough variety for the beam to prune.
 */
PCFGModel varied_model() {
    std::vector<std::string> corpus;
    const char* words[] = {"monkey", "dragon", "shadow", "master", "summer", "hunter", "soccer", "purple"};
    const char* digits[] = {"1", "12", "123", "2024", "99", "7", "69", "2000"};
    const char* symbols[] = {"!", "!!", "#", ".", "*"};

    for (int i = 0; i < 8; i++) {
        for (int j = 0; j <= i; j++) {
            corpus.push_back(std::string(words[i]) + digits[(i + j) % 8]);
        }
        corpus.push_back(std::string(words[i]) + symbols[i % 5]);
        corpus.push_back(std::string(digits[i]) + words[(i + 3) % 8]);
    }
    corpus.push_back("iloveyou");
    corpus.push_back("sunshine");
    corpus.push_back("123456");
    return fit(corpus);
}

std::vector<std::string> texts(const std::vector<Candidate>& candidates) {
    std::vector<std::string> out;
    for (const auto& c : candidates) out.push_back(c.text);
    return out;
}

void test_scenario_top1() {
    PCFGModel model = scenario_model();
    GenerationConfig config;
    config.bounds.min_length = 6;
    config.beam.topk_templates = 1;
    config.beam.topk_per_slot = 1;

    auto candidates = generate_deterministic(model, config);
    assert(candidates.size() == 1);
    assert(candidates[0].text == "password1");
    assert(candidates[0].source == CandidateSource::DETERMINISTIC);
    assert(candidates[0].score.has_value());
    assert(*candidates[0].score == score(model, "password1"));

    std::cout << "[PASS] Top-1 beam reconstructs the most frequent combination\n";
}

void test_template_selection() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    GenerationConfig config;
    BeamGenerator all(scorer, config);
    auto selected = all.select_templates();
    assert(selected.size() == 2);
    assert(selected[0]->label == "WORD8|DIGITS1");
    assert(selected[1]->label == "WORD7");

    // Templates whose fixed length falls outside the bounds are skipped
    config.bounds.min_length = 8;
    BeamGenerator bounded(scorer, config);
    selected = bounded.select_templates();
    assert(selected.size() == 1);
    assert(selected[0]->label == "WORD8|DIGITS1");

    std::cout << "[PASS] Template selection\n";
}

void test_beam_ordering() {
    PCFGModel model = scenario_model();
    GenerationConfig config;

    auto candidates = generate_deterministic(model, config);
    assert(texts(candidates) == (std::vector<std::string>{"password1", "password2", "letmeln"}));

    std::cout << "[PASS] Beam ordering by template rank then score\n";
}

void test_beam_deterministic() {
    PCFGModel model = varied_model();
    GenerationConfig config;
    config.beam.topk_per_slot = 4;
    config.beam.width = 5;

    auto first = generate_deterministic(model, config);
    auto second = generate_deterministic(model, config);
    assert(!first.empty());
    assert(texts(first) == texts(second));

    std::cout << "[PASS] Beam output repeatable\n";
}

void test_beam_bounds() {
    PCFGModel model = varied_model();
    Scorer scorer(model);

    GenerationConfig config;
    config.bounds.min_length = 7;
    config.bounds.max_length = 10;
    config.beam.topk_per_slot = 6;
    config.beam.width = 10;
    config.beam.max_per_template = 8;

    BeamGenerator generator(scorer, config);
    auto candidates = generator.generate();
    assert(!candidates.empty());
    assert(generator.stats().partials_pruned > 0);
    assert(generator.stats().emitted == candidates.size());

    std::set<std::string> unique;
    for (const auto& c : candidates) {
        assert(config.bounds.contains(c.text.size()));
        unique.insert(c.text);
    }
    assert(unique.size() == candidates.size());
    assert(candidates.size() <= config.beam.topk_templates * config.beam.max_per_template);

    // Each template's group is ordered by score, highest first
    for (size_t i = 1; i < candidates.size(); i++) {
        auto a = scorer.score_parse(candidates[i - 1].text).parse.label();
        auto b = scorer.score_parse(candidates[i].text).parse.label();
        if (a == b) {
            assert(*candidates[i - 1].score >= *candidates[i].score);
        }
    }

    std::cout << "[PASS] Beam respects length bounds and caps\n";
}

void test_beam_max_total() {
    PCFGModel model = varied_model();

    for (size_t cap : {1, 5, 17}) {
        GenerationConfig config;
        config.beam.max_total = cap;
        auto candidates = generate_deterministic(model, config);
        assert(candidates.size() == cap);
    }

    GenerationConfig config;
    config.beam.max_total = 0;
    assert(generate_deterministic(model, config).empty());

    std::cout << "[PASS] Beam respects the total cap\n";
}

void test_beam_threads() {
    PCFGModel model = varied_model();
    GenerationConfig config;
    config.beam.topk_per_slot = 5;
    config.beam.width = 8;
    config.beam.max_total = 60;

    auto serial = generate_deterministic(model, config);
    config.beam.threads = 4;
    auto parallel = generate_deterministic(model, config);
    assert(texts(serial) == texts(parallel));

    std::cout << "[PASS] Threaded beam matches serial output\n";
}

void test_beam_rejects_reparsed() {
    // "abc" + "1" + "def" normalizes to "abcldef": a different template
    PCFGModel model = fit(std::vector<std::string>{"abc1", "1def", "abc2def"});
    assert(model.table().template_count("WORD3|DIGITS1|WORD3") == 1);
    Scorer scorer(model);

    GenerationConfig config;
    config.bounds.min_length = 1;
    BeamGenerator generator(scorer, config);
    auto candidates = texts(generator.generate());

    assert(generator.stats().rejected > 0);
    assert(std::find(candidates.begin(), candidates.end(), "abc2def") != candidates.end());
    assert(std::find(candidates.begin(), candidates.end(), "abc1def") == candidates.end());
    for (const auto& text : candidates) {
        auto parsed = scorer.score_parse(text).parse;
        assert(model.table().template_count(parsed.label()) > 0);
    }

    std::cout << "[PASS] Beam drops candidates that change template\n";
}

void test_sampling_reproducible() {
    PCFGModel model = varied_model();
    SamplingConfig config;
    config.num_samples = 500;

    auto first = generate_stochastic(model, config, 7);
    auto second = generate_stochastic(model, config, 7);
    auto other = generate_stochastic(model, config, 8);

    assert(first.size() == 500);
    assert(texts(first) == texts(second));
    assert(texts(first) != texts(other));
    for (const auto& c : first) {
        assert(c.source == CandidateSource::STOCHASTIC);
        assert(c.score.has_value());
    }

    SamplingConfig none;
    none.num_samples = 0;
    assert(generate_stochastic(model, none, 7).empty());

    // The generator can be rerun and keeps its seed behavior
    Scorer scorer(model);
    SamplingGenerator generator(scorer, config);
    assert(texts(generator.generate(7)) == texts(first));
    assert(texts(generator.generate(7)) == texts(first));

    std::cout << "[PASS] Sampling reproducible for a fixed seed\n";
}

void test_sampling_distribution() {
    PCFGModel model = scenario_model();
    SamplingConfig config;
    config.num_samples = 3000;

    auto samples = generate_stochastic(model, config, 42);
    assert(samples.size() == 3000);

    size_t long_form = 0;
    for (const auto& c : samples) {
        assert(c.text == "password1" || c.text == "password2" || c.text == "letmeln");
        if (c.text.size() == 9) long_form++;
    }

    // WORD8|DIGITS1 carries 2 of 3 observations
    assert(long_form > 1700 && long_form < 2300);

    std::cout << "[PASS] Sampling follows template frequency\n";
}

void test_sampling_unfillable() {
    TrainingConfig training;
    training.trim_top_n = 1;
    PCFGModel model = fit(std::vector<std::string>{"password1", "password1", "dragon12"}, training);

    Scorer scorer(model);
    SamplingConfig config;
    config.num_samples = 300;
    SamplingGenerator generator(scorer, config);
    auto samples = generator.generate();

    const auto& stats = generator.stats();
    assert(stats.draws == 300);
    assert(stats.unfillable > 0);
    assert(stats.emitted + stats.unfillable == stats.draws);
    for (const auto& c : samples) {
        assert(c.text == "password1");
    }

    // The beam skips the same unfillable template
    GenerationConfig gen;
    auto det = generate_deterministic(scorer, gen);
    assert(texts(det) == (std::vector<std::string>{"password1"}));

    std::cout << "[PASS] Unfillable templates skipped\n";
}

void test_untrained_model() {
    PCFGModel empty;

    bool threw = false;
    try {
        generate_deterministic(empty, GenerationConfig{});
    } catch (const ModelNotTrainedError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        generate_stochastic(empty, SamplingConfig{}, 42);
    } catch (const ModelNotTrainedError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Untrained model rejected\n";
}

void test_invalid_config() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    GenerationConfig config;
    config.bounds.min_length = 20;
    config.bounds.max_length = 10;
    bool threw = false;
    try {
        BeamGenerator generator(scorer, config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    config = GenerationConfig{};
    config.beam.width = 0;
    threw = false;
    try {
        generate_deterministic(scorer, config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Invalid generation config rejected\n";
}

int main() {
    std::cout << "=== Generator Tests ===\n\n";

    test_scenario_top1();
    test_template_selection();
    test_beam_ordering();
    test_beam_deterministic();
    test_beam_bounds();
    test_beam_max_total();
    test_beam_threads();
    test_beam_rejects_reparsed();
    test_sampling_reproducible();
    test_sampling_distribution();
    test_sampling_unfillable();
    test_untrained_model();
    test_invalid_config();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
