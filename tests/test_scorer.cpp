/**
 * Scorer Tests
 *
 * Log-probability scoring under trained models.
 */

#include "../src/pcfg/scorer.hpp"
#include "../src/pcfg/trainer.hpp"
#include "../src/core/errors.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace passgram;
using namespace passgram::pcfg;

PCFGModel scenario_model() {
    TrainingConfig config;
    config.alpha = 1.0;
    return fit(std::vector<std::string>{"password1", "Password2", "letme1n"}, config);
}

void test_scenario() {
    PCFGModel model = scenario_model();

    double common = score(model, "password1");
    double random = score(model, "xk7!qz2");
    assert(common > random);

    // log(3/6) + log(3/6) + log(2/5)
    double expected = std::log(3.0 / 6.0) + std::log(3.0 / 6.0) + std::log(2.0 / 5.0);
    assert(std::abs(common - expected) < 1e-12);

    std::cout << "[PASS] Frequent password outscores random string\n";
}

void test_score_decomposition() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    ScoredParse scored = scorer.score_parse("letme1n");
    assert(scored.parse.label() == "WORD7");
    assert(scored.parse.tokens[0].value == "letmeln");

    double expected = model.template_log_prob("WORD7") +
                      model.token_log_prob(TokenType::WORD, "letmeln");
    assert(scored.score == expected);
    assert(scorer.score("letme1n") == expected);

    std::cout << "[PASS] Score is template plus token log-probabilities\n";
}

void test_normalized_forms_agree() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    double base = scorer.score("password1");
    assert(scorer.score("PASSWORD1") == base);
    assert(scorer.score("p@ssword1") == base);
    assert(scorer.score("P@55W0RD1") == base);

    std::cout << "[PASS] Normalized forms score the same\n";
}

void test_unseen_finite() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    for (const char* candidate : {"zzzzzzzzzzzz", "~~~", "9", "caf\xc3\xa9!"}) {
        double s = scorer.score(candidate);
        assert(std::isfinite(s));
        assert(s < 0.0);
    }

    std::cout << "[PASS] Unseen candidates get finite scores\n";
}

void test_dominance() {
    // Every part of "monkey12" is more frequent than the matching part of "dragon777"
    std::vector<std::string> corpus;
    for (int i = 0; i < 3; i++) corpus.push_back("monkey12");
    corpus.push_back("dragon777");
    corpus.push_back("sunshine!");
    corpus.push_back("qwerty");

    PCFGModel model = fit(corpus);
    assert(model.table().template_count("WORD6|DIGITS2") > model.table().template_count("WORD6|DIGITS3"));

    for (double alpha : {0.01, 0.5, 1.0, 5.0}) {
        TrainingConfig config;
        config.alpha = alpha;
        PCFGModel smoothed = fit(corpus, config);
        assert(score(smoothed, "monkey12") > score(smoothed, "dragon777"));
    }

    std::cout << "[PASS] Dominating frequencies give higher scores\n";
}

void test_invalid_candidates() {
    PCFGModel model = scenario_model();
    Scorer scorer(model);

    for (const std::string& candidate : {std::string(""), std::string("a\x01" "b"), std::string("x\ny")}) {
        bool threw = false;
        try {
            scorer.score(candidate);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] Invalid candidates rejected\n";
}

void test_untrained_model() {
    PCFGModel empty;
    bool threw = false;
    try {
        Scorer scorer(empty);
    } catch (const ModelNotTrainedError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        score(empty, "password1");
    } catch (const ModelNotTrainedError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Untrained model rejected\n";
}

void test_vocabulary_binding() {
    auto vocab = std::make_shared<text::Vocabulary>();
    vocab->add("password");

    PCFGModel model = fit(std::vector<std::string>{"password1", "letme1n"}, TrainingConfig{}, vocab);
    assert(model.table().template_count("FRAG7") == 1);

    Scorer scorer(model, vocab);
    assert(scorer.score_parse("letme1n").parse.label() == "FRAG7");

    // A model trained with a vocabulary cannot be scored without it
    bool threw = false;
    try {
        Scorer plain(model);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    auto other = std::make_shared<text::Vocabulary>();
    other->add("dragon");
    threw = false;
    try {
        Scorer mismatched(model, other);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Vocabulary must match training\n";
}

void test_leet_setting_followed() {
    TrainingConfig config;
    config.leet = false;
    PCFGModel model = fit(std::vector<std::string>{"p@ssword"}, config);
    Scorer scorer(model);

    assert(scorer.score_parse("p@ssword").parse.label() == "FRAG1|SYMBOL1|WORD6");
    assert(scorer.score("p@ssword") > scorer.score("password"));

    std::cout << "[PASS] Scorer follows the model's leet setting\n";
}

int main() {
    std::cout << "=== Scorer Tests ===\n\n";

    test_scenario();
    test_score_decomposition();
    test_normalized_forms_agree();
    test_unseen_finite();
    test_dominance();
    test_invalid_candidates();
    test_untrained_model();
    test_vocabulary_binding();
    test_leet_setting_followed();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
