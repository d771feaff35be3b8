/**
 * Aggregator Tests
 *
 * Order-preserving deduplication, length filtering and candidate artifacts.
 */

#include "../src/generators/aggregator.hpp"
#include "../src/generators/beam_generator.hpp"
#include "../src/generators/sampling_generator.hpp"
#include "../src/io/candidate_file.hpp"
#include "../src/pcfg/trainer.hpp"
#include "../src/core/errors.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace passgram;

std::vector<Candidate> make_candidates(const std::vector<std::string>& texts, CandidateSource source) {
    std::vector<Candidate> out;
    for (const auto& text : texts) {
        out.push_back(Candidate{.text = text, .source = source, .score = std::nullopt});
    }
    return out;
}

void test_first_occurrence_wins() {
    LengthBounds bounds{.min_length = 1, .max_length = 64};
    Aggregator aggregator(bounds);

    assert(aggregator.add("monkey1"));
    assert(aggregator.add("dragon"));
    assert(!aggregator.add("monkey1"));
    assert(aggregator.add("shadow"));
    assert(!aggregator.add("dragon"));

    assert(aggregator.result() == (std::vector<std::string>{"monkey1", "dragon", "shadow"}));
    assert(aggregator.stats().input == 5);
    assert(aggregator.stats().duplicates == 2);
    assert(aggregator.stats().output == 3);

    std::cout << "[PASS] First occurrence wins\n";
}

void test_length_filter() {
    LengthBounds bounds{.min_length = 6, .max_length = 8};
    Aggregator aggregator(bounds);

    assert(!aggregator.add("short"));
    assert(aggregator.add("sixsix"));
    assert(aggregator.add("eighteig"));
    assert(!aggregator.add("ninenine9"));
    assert(!aggregator.add(""));

    assert(aggregator.result().size() == 2);
    assert(aggregator.stats().out_of_range == 3);

    std::cout << "[PASS] Length filter\n";
}

void test_combine_order() {
    auto det = make_candidates({"password1", "password2", "letmeln"}, CandidateSource::DETERMINISTIC);
    auto sto = make_candidates({"letmeln", "abc", "password1", "dragon99", "dragon99"}, CandidateSource::STOCHASTIC);

    AggregateStats stats;
    auto combined = combine(det, sto, LengthBounds{}, &stats);

    assert(combined == (std::vector<std::string>{"password1", "password2", "letmeln", "dragon99"}));
    assert(stats.input == 8);
    assert(stats.duplicates == 3);
    assert(stats.out_of_range == 1);
    assert(stats.output == 4);

    // Empty inputs give an empty result
    assert(combine({}, {}, LengthBounds{}).empty());

    std::cout << "[PASS] Deterministic candidates keep priority\n";
}

void test_combine_generated() {
    std::vector<std::string> corpus;
    for (const char* word : {"monkey", "dragon", "hello", "abc", "sunshine", "qwertyuiop"}) {
        for (const char* suffix : {"", "1", "12", "!", "2024", "99!"}) {
            corpus.push_back(std::string(word) + suffix);
        }
    }
    pcfg::PCFGModel model = pcfg::fit(corpus);

    GenerationConfig config;
    config.bounds.min_length = 7;
    config.bounds.max_length = 10;
    config.sampling.num_samples = 2000;

    auto det = pcfg::generate_deterministic(model, config);
    auto sto = pcfg::generate_stochastic(model, config.sampling, config.sampling.seed);
    auto combined = combine(det, sto, config.bounds);

    std::set<std::string> unique(combined.begin(), combined.end());
    assert(unique.size() == combined.size());
    for (const auto& text : combined) {
        assert(text.size() >= 7 && text.size() <= 10);
    }

    std::cout << "[PASS] Combined output has no duplicates or out-of-range lengths\n";
}

void test_take() {
    Aggregator aggregator(LengthBounds{});
    aggregator.add(make_candidates({"monkey12", "monkey12", "dragon12"}, CandidateSource::STOCHASTIC));
    auto result = aggregator.take();
    assert(result.size() == 2);
    assert(result[0] == "monkey12");

    std::cout << "[PASS] Take result\n";
}

void test_hash() {
    XxHash3 hash;
    assert(hash("password") == hash(std::string("password")));
    assert(hash("password") != hash("password1"));

    std::cout << "[PASS] XXH3 hasher\n";
}

void test_candidate_files() {
    auto dir = std::filesystem::temp_directory_path() / "passgram_test_candidates";
    std::filesystem::remove_all(dir);
    auto path = (dir / "nested" / "candidates.txt").string();

    std::vector<std::string> lines = {"password1", "letmeln", "caf\xc3\xa9!"};
    assert(write_candidates(path, lines) == 3);
    assert(!std::filesystem::exists(path + ".tmp"));
    assert(read_candidates(path) == lines);

    std::ifstream raw(path, std::ios::binary);
    std::stringstream content;
    content << raw.rdbuf();
    assert(content.str() == "password1\nletmeln\ncaf\xc3\xa9!\n");

    // An empty list still produces a file
    auto empty_path = (dir / "empty.txt").string();
    assert(write_candidates(empty_path, {}) == 0);
    assert(std::filesystem::exists(empty_path));
    assert(read_candidates(empty_path).empty());

    bool threw = false;
    try {
        write_candidates((dir / "bad.txt").string(), {"good", "bad\nline"});
    } catch (const InvalidInputError&) {
        threw = true;
    }
    assert(threw);
    assert(!std::filesystem::exists(dir / "bad.txt"));
    assert(!std::filesystem::exists(dir / "bad.txt.tmp"));

    threw = false;
    try {
        read_candidates((dir / "missing.txt").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] Candidate files\n";
}

int main() {
    std::cout << "=== Aggregator Tests ===\n\n";

    test_first_occurrence_wins();
    test_length_filter();
    test_combine_order();
    test_combine_generated();
    test_take();
    test_hash();
    test_candidate_files();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
