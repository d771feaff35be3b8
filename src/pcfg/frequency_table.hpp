/**
 * passgram Frequency Table
 *
 * Raw counts accumulated during training: template label -> count and,
 * per token type, token value -> count.
 */

#pragma once

#include "../core/types.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace passgram {
namespace pcfg {

using CountMap = std::unordered_map<std::string, uint64_t>;

class FrequencyTable {
public:
    void add_template(const std::string& label, uint64_t n = 1) {
        templates_[label] += n;
        template_total_ += n;
    }

    void add_token(TokenType type, const std::string& value, uint64_t n = 1) {
        size_t idx = token_type_index(type);
        tokens_[idx][value] += n;
        token_totals_[idx] += n;
    }

    uint64_t template_count(const std::string& label) const {
        auto it = templates_.find(label);
        return it == templates_.end() ? 0 : it->second;
    }

    uint64_t token_count(TokenType type, const std::string& value) const {
        const auto& values = tokens_[token_type_index(type)];
        auto it = values.find(value);
        return it == values.end() ? 0 : it->second;
    }

    const CountMap& templates() const { return templates_; }
    const CountMap& tokens(TokenType type) const { return tokens_[token_type_index(type)]; }

    uint64_t template_total() const { return template_total_; }
    uint64_t token_total(TokenType type) const { return token_totals_[token_type_index(type)]; }

    bool empty() const { return templates_.empty(); }

    /**
     * Merge another table's counts into this one.
     */
    void merge(const FrequencyTable& other) {
        for (const auto& [label, count] : other.templates_) {
            add_template(label, count);
        }
        for (TokenType type : ALL_TOKEN_TYPES) {
            for (const auto& [value, count] : other.tokens(type)) {
                add_token(type, value, count);
            }
        }
    }

    /**
     * Keep only the top_n most frequent values of each token type
     * (ties broken by value). Totals are recomputed from what is kept.
     */
    void trim_tokens(size_t top_n) {
        for (size_t idx = 0; idx < NUM_TOKEN_TYPES; ++idx) {
            auto& values = tokens_[idx];
            if (values.size() <= top_n) continue;

            std::vector<std::pair<std::string, uint64_t>> ranked(values.begin(), values.end());
            std::nth_element(ranked.begin(), ranked.begin() + top_n, ranked.end(),
                             [](const auto& a, const auto& b) {
                                 if (a.second != b.second) return a.second > b.second;
                                 return a.first < b.first;
                             });
            ranked.resize(top_n);

            CountMap kept;
            uint64_t total = 0;
            for (auto& [value, count] : ranked) {
                total += count;
                kept.emplace(std::move(value), count);
            }
            values = std::move(kept);
            token_totals_[idx] = total;
        }
    }

    bool operator==(const FrequencyTable& other) const {
        return templates_ == other.templates_ && tokens_ == other.tokens_ &&
               template_total_ == other.template_total_ && token_totals_ == other.token_totals_;
    }

private:
    CountMap templates_;
    std::array<CountMap, NUM_TOKEN_TYPES> tokens_;
    uint64_t template_total_ = 0;
    std::array<uint64_t, NUM_TOKEN_TYPES> token_totals_{};
};

}  // namespace pcfg
}  // namespace passgram
