/**
 * PCFG Model Implementation
 */

#include "model.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace passgram {
namespace pcfg {

PCFGModel::PCFGModel() : alpha_(1.0) {
    build_index();
}

PCFGModel::PCFGModel(double alpha, FrequencyTable table, TokenizerSettings settings)
    : alpha_(alpha), table_(std::move(table)), settings_(settings) {
    if (!std::isfinite(alpha_) || alpha_ <= 0.0) {
        throw ConfigError("Smoothing alpha must be a positive finite number");
    }
    build_index();
}

void PCFGModel::require_trained() const {
    if (!trained()) {
        throw ModelNotTrainedError("Model has no training observations");
    }
}

double PCFGModel::template_log_prob(const std::string& label) const {
    double count = static_cast<double>(table_.template_count(label));
    return std::log(count + alpha_) - template_log_denominator_;
}

double PCFGModel::token_log_prob(TokenType type, const std::string& value) const {
    double count = static_cast<double>(table_.token_count(type, value));
    return std::log(count + alpha_) - token_log_denominators_[token_type_index(type)];
}

const std::vector<RankedToken>& PCFGModel::ranked_tokens(TokenType type, size_t length) const {
    static const std::vector<RankedToken> empty;
    const auto& by_length = ranked_tokens_[token_type_index(type)];
    auto it = by_length.find(length);
    return it == by_length.end() ? empty : it->second;
}

void PCFGModel::build_index() {
    // Denominators: N + alpha * (V + 1), the +1 reserving mass for unseen entries
    template_log_denominator_ = std::log(
        static_cast<double>(table_.template_total()) +
        alpha_ * static_cast<double>(table_.templates().size() + 1));

    for (TokenType type : ALL_TOKEN_TYPES) {
        token_log_denominators_[token_type_index(type)] = std::log(
            static_cast<double>(table_.token_total(type)) +
            alpha_ * static_cast<double>(table_.tokens(type).size() + 1));
    }

    ranked_templates_.clear();
    ranked_templates_.reserve(table_.templates().size());
    for (const auto& [label, count] : table_.templates()) {
        ranked_templates_.push_back({label, Template::parse(label), count});
    }
    std::sort(ranked_templates_.begin(), ranked_templates_.end(),
              [](const RankedTemplate& a, const RankedTemplate& b) {
                  if (a.count != b.count) return a.count > b.count;
                  return a.label < b.label;
              });

    for (TokenType type : ALL_TOKEN_TYPES) {
        auto& by_length = ranked_tokens_[token_type_index(type)];
        by_length.clear();
        for (const auto& [value, count] : table_.tokens(type)) {
            by_length[value.size()].push_back({value, count});
        }
        for (auto& [length, values] : by_length) {
            std::sort(values.begin(), values.end(),
                      [](const RankedToken& a, const RankedToken& b) {
                          if (a.count != b.count) return a.count > b.count;
                          return a.value < b.value;
                      });
        }
    }
}

}  // namespace pcfg
}  // namespace passgram
