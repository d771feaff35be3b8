/**
 * PCFG Trainer Implementation
 */

#include "trainer.hpp"
#include "../core/logger.hpp"
#include <fstream>
#include <stdexcept>

namespace passgram {
namespace pcfg {

Trainer::Trainer(const TrainingConfig& config, std::shared_ptr<const text::Vocabulary> vocabulary)
    : config_(config),
      vocabulary_(vocabulary && !vocabulary->empty() ? std::move(vocabulary) : nullptr),
      normalizer_(text::Normalizer::default_table(), config.leet),
      tokenizer_(config.min_word_length, vocabulary_) {
    validate(config_);
}

bool Trainer::add(std::string_view line) {
    if (config_.max_lines != 0 && stats_.lines_read >= config_.max_lines) {
        return false;
    }

    stats_.lines_read++;
    if (progress_ && config_.progress_interval != 0 &&
        stats_.lines_read % config_.progress_interval == 0) {
        progress_(stats_);
    }

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (line.empty()) {
        skip(SkipReason::EMPTY, "");
        return true;
    }

    if (line.size() < config_.min_length ||
        (config_.max_length != 0 && line.size() > config_.max_length)) {
        stats_.filtered_length++;
        return true;
    }

    // Normalization preserves length, so no token value can exceed the line
    if (line.size() > MAX_ENTRY_BYTES) {
        skip(SkipReason::MALFORMED, "longer than " + std::to_string(MAX_ENTRY_BYTES) + " bytes");
        return true;
    }

    text::Tokenization parsed;
    try {
        parsed = tokenizer_.tokenize(normalizer_.normalize(line));
    } catch (const InvalidInputError& e) {
        skip(SkipReason::MALFORMED, e.what());
        return true;
    }

    std::string label = parsed.label();
    if (label.size() > MAX_ENTRY_BYTES) {
        skip(SkipReason::MALFORMED, "template label longer than " + std::to_string(MAX_ENTRY_BYTES) + " bytes");
        return true;
    }

    table_.add_template(label);
    for (const auto& token : parsed.tokens) {
        table_.add_token(token.type, token.value);
    }
    stats_.processed++;

    if (config_.trim_top_n != 0 && stats_.processed % config_.trim_interval == 0) {
        table_.trim_tokens(config_.trim_top_n);
        PASSGRAM_LOG_DEBUG("Trimmed token tables to top " + std::to_string(config_.trim_top_n));
    }

    return true;
}

void Trainer::skip(SkipReason reason, std::string_view detail) {
    if (reason == SkipReason::EMPTY) {
        stats_.skipped_empty++;
    } else {
        stats_.skipped_malformed++;
        PASSGRAM_LOG_DEBUG("Skipped line " + std::to_string(stats_.lines_read) + ": " + std::string(detail));
    }
}

void Trainer::train(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!add(line)) break;
    }
}

void Trainer::train_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open corpus file: " + path);
    }
    PASSGRAM_LOG_INFO("Training from " + path);
    train(file);
}

PCFGModel Trainer::build_model() const {
    TokenizerSettings settings;
    settings.leet = config_.leet;
    settings.min_word_length = static_cast<uint32_t>(config_.min_word_length);
    settings.vocabulary_fingerprint = vocabulary_ ? vocabulary_->fingerprint() : 0;

    if (config_.trim_top_n == 0) {
        return PCFGModel(config_.alpha, table_, settings);
    }

    FrequencyTable trimmed = table_;
    trimmed.trim_tokens(config_.trim_top_n);
    return PCFGModel(config_.alpha, std::move(trimmed), settings);
}

}  // namespace pcfg
}  // namespace passgram
