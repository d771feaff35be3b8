/**
 * passgram Scorer
 *
 * Smoothed log-probability of a candidate under a trained model:
 *   log P(template) + sum log P(value | type)
 */

#pragma once

#include "../text/normalizer.hpp"
#include "../text/tokenizer.hpp"
#include "../text/vocabulary.hpp"
#include "model.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace passgram {
namespace pcfg {

struct ScoredParse {
    text::Tokenization parse;
    double score;
};

/**
 * Binds a model to the normalizer/tokenizer it was trained with.
 * Holds a reference: the model must outlive the scorer.
 */
class Scorer {
public:
    /**
     * @throws ModelNotTrainedError if the model is empty
     * @throws ConfigError if the vocabulary does not match the model's
     */
    explicit Scorer(const PCFGModel& model,
                    std::shared_ptr<const text::Vocabulary> vocabulary = nullptr);
    explicit Scorer(PCFGModel&&, std::shared_ptr<const text::Vocabulary> = nullptr) = delete;

    /**
     * @throws InvalidInputError on empty or non-text candidates
     */
    double score(std::string_view candidate) const {
        return score_parse(candidate).score;
    }

    /**
     * Score and also return the parse, for callers that need the template.
     */
    ScoredParse score_parse(std::string_view candidate) const;

    const PCFGModel& model() const { return model_; }

private:
    const PCFGModel& model_;
    text::Normalizer normalizer_;
    text::Tokenizer tokenizer_;
};

/**
 * Convenience form for a model trained without a vocabulary.
 */
double score(const PCFGModel& model, std::string_view candidate);

}  // namespace pcfg
}  // namespace passgram
