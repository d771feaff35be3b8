/**
 * passgram PCFG Model
 *
 * Immutable, trained grammar: smoothed template and token probabilities plus
 * the frequency-ranked views the generators walk. Safe to share read-only
 * between threads.
 */

#pragma once

#include "../core/types.hpp"
#include "frequency_table.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace passgram {
namespace pcfg {

/**
 * How training text was normalized and tokenized. Inference must match.
 */
struct TokenizerSettings {
    bool leet = true;
    uint32_t min_word_length = 3;
    uint64_t vocabulary_fingerprint = 0;  // 0 = no vocabulary

    bool operator==(const TokenizerSettings& other) const = default;
};

struct RankedTemplate {
    std::string label;
    Template tmpl;
    uint64_t count;
};

struct RankedToken {
    std::string value;
    uint64_t count;
};

class PCFGModel {
public:
    static constexpr uint32_t SCHEMA_VERSION = 2;

    /**
     * Untrained model; scoring or generating against it throws.
     */
    PCFGModel();

    /**
     * @throws ConfigError if alpha is not a positive finite number
     * @throws InvalidInputError if a template label cannot be parsed
     */
    PCFGModel(double alpha, FrequencyTable table, TokenizerSettings settings = {});

    double alpha() const { return alpha_; }
    uint64_t total_examples() const { return table_.template_total(); }
    uint32_t schema_version() const { return SCHEMA_VERSION; }
    const FrequencyTable& table() const { return table_; }
    const TokenizerSettings& settings() const { return settings_; }

    bool trained() const { return !table_.empty(); }

    /**
     * @throws ModelNotTrainedError if the model holds no observations
     */
    void require_trained() const;

    /**
     * log((c + alpha) / (N + alpha * (V + 1))) over the template table.
     */
    double template_log_prob(const std::string& label) const;

    /**
     * Same smoothing over the value table of the token's type.
     */
    double token_log_prob(TokenType type, const std::string& value) const;

    /**
     * Templates by count desc, label asc.
     */
    const std::vector<RankedTemplate>& ranked_templates() const { return ranked_templates_; }

    /**
     * Values of one type and byte length, by count desc, value asc.
     */
    const std::vector<RankedToken>& ranked_tokens(TokenType type, size_t length) const;

    /**
     * Counts, alpha, settings and schema version all equal.
     */
    bool operator==(const PCFGModel& other) const {
        return alpha_ == other.alpha_ && settings_ == other.settings_ && table_ == other.table_;
    }

private:
    double alpha_;
    FrequencyTable table_;
    TokenizerSettings settings_;

    double template_log_denominator_ = 0.0;
    std::array<double, NUM_TOKEN_TYPES> token_log_denominators_{};

    std::vector<RankedTemplate> ranked_templates_;
    std::array<std::unordered_map<size_t, std::vector<RankedToken>>, NUM_TOKEN_TYPES> ranked_tokens_;

    void build_index();
};

}  // namespace pcfg
}  // namespace passgram
