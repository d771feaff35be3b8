/**
 * Scorer Implementation
 */

#include "scorer.hpp"
#include "../core/errors.hpp"

namespace passgram {
namespace pcfg {

namespace {

std::shared_ptr<const text::Vocabulary> checked_vocabulary(
    const PCFGModel& model, std::shared_ptr<const text::Vocabulary> vocabulary) {
    model.require_trained();

    if (vocabulary && vocabulary->empty()) vocabulary = nullptr;
    uint64_t fingerprint = vocabulary ? vocabulary->fingerprint() : 0;
    if (fingerprint != model.settings().vocabulary_fingerprint) {
        throw ConfigError(model.settings().vocabulary_fingerprint == 0
                              ? "Model was trained without a vocabulary but one was supplied"
                              : "Vocabulary does not match the one the model was trained with");
    }
    return vocabulary;
}

}  // namespace

Scorer::Scorer(const PCFGModel& model, std::shared_ptr<const text::Vocabulary> vocabulary)
    : model_(model),
      normalizer_(text::Normalizer::default_table(), model.settings().leet),
      tokenizer_(model.settings().min_word_length, checked_vocabulary(model, std::move(vocabulary))) {}

ScoredParse Scorer::score_parse(std::string_view candidate) const {
    ScoredParse result{tokenizer_.tokenize(normalizer_.normalize(candidate)), 0.0};

    result.score = model_.template_log_prob(result.parse.label());
    for (const auto& token : result.parse.tokens) {
        result.score += model_.token_log_prob(token.type, token.value);
    }
    return result;
}

double score(const PCFGModel& model, std::string_view candidate) {
    return Scorer(model).score(candidate);
}

}  // namespace pcfg
}  // namespace passgram
