/**
 * passgram Configuration
 *
 * Explicit configuration values passed into training and generation calls.
 * Nothing here is process-wide; callers own their copies.
 */

#pragma once

#include "errors.hpp"
#include <cstdint>
#include <cstddef>
#include <cmath>
#include <string>

namespace passgram {

/**
 * Trainer configuration.
 */
struct TrainingConfig {
    size_t min_length = 0;              // Skip shorter lines before tokenizing (0 = no filter)
    size_t max_length = 0;              // Skip longer lines (0 = no filter)
    double alpha = 1.0;                 // Additive smoothing strength
    bool leet = true;                   // Leet-speak normalization
    size_t min_word_length = 3;         // Letter runs shorter than this are FRAG
    uint64_t max_lines = 0;             // Stop after N lines read (0 = whole corpus)
    size_t trim_top_n = 0;              // Keep top N values per token type (0 = keep all)
    uint64_t trim_interval = 500'000;   // Trim every N processed lines
    uint64_t progress_interval = 100'000;
};

/**
 * Inclusive byte-length bounds for emitted candidates.
 */
struct LengthBounds {
    size_t min_length = 6;
    size_t max_length = 64;

    bool contains(size_t length) const {
        return length >= min_length && length <= max_length;
    }
};

/**
 * Deterministic beam search bounds.
 */
struct BeamConfig {
    size_t topk_templates = 40;
    size_t topk_per_slot = 300;
    size_t width = 2000;                // Partials kept after each slot
    size_t max_per_template = 2000;
    size_t max_total = 200'000;
    size_t threads = 1;                 // Templates expanded concurrently
};

/**
 * Stochastic sampling bounds.
 */
struct SamplingConfig {
    size_t num_samples = 3000;
    uint64_t seed = 42;
};

struct GenerationConfig {
    LengthBounds bounds;
    BeamConfig beam;
    SamplingConfig sampling;
};

inline void validate(const TrainingConfig& config) {
    if (!std::isfinite(config.alpha) || config.alpha <= 0.0) {
        throw ConfigError("alpha must be a positive finite number");
    }
    if (config.max_length != 0 && config.min_length > config.max_length) {
        throw ConfigError("training min_length exceeds max_length");
    }
    if (config.min_word_length == 0) {
        throw ConfigError("min_word_length must be at least 1");
    }
    if (config.trim_top_n != 0 && config.trim_interval == 0) {
        throw ConfigError("trim_interval must be positive when trimming is enabled");
    }
}

/**
 * Output counts (beam.max_total, sampling.num_samples) may be 0 and then
 * request nothing from that strategy; search bounds must be positive.
 */
inline void validate(const GenerationConfig& config) {
    if (config.bounds.min_length > config.bounds.max_length) {
        throw ConfigError("MIN_PASSWORD_LENGTH exceeds MAX_PASSWORD_LENGTH");
    }
    if (config.beam.topk_templates == 0 || config.beam.topk_per_slot == 0 ||
        config.beam.width == 0 || config.beam.max_per_template == 0) {
        throw ConfigError("beam search bounds must be positive");
    }
    if (config.beam.threads == 0) {
        throw ConfigError("beam threads must be at least 1");
    }
}

}  // namespace passgram
