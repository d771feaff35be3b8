/**
 * passgram PCFG Trainer
 *
 * Learns template and token frequencies from a password corpus in a single
 * streaming pass. Memory grows with the vocabulary, never with the corpus.
 */

#pragma once

#include "../core/config.hpp"
#include "../text/normalizer.hpp"
#include "../text/tokenizer.hpp"
#include "../text/vocabulary.hpp"
#include "frequency_table.hpp"
#include "model.hpp"
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace passgram {
namespace pcfg {

/**
 * Why a training line was skipped (the pass always continues).
 */
enum class SkipReason : uint8_t {
    EMPTY,
    MALFORMED,   // Untokenizable, or too long to store in a model
};

struct TrainingStats {
    uint64_t lines_read = 0;
    uint64_t processed = 0;
    uint64_t skipped_empty = 0;
    uint64_t skipped_malformed = 0;
    uint64_t filtered_length = 0;   // Outside [min_length, max_length]

    uint64_t skipped() const { return skipped_empty + skipped_malformed; }
};

using TrainingProgressCallback = std::function<void(const TrainingStats&)>;

class Trainer {
public:
    /**
     * @throws ConfigError on invalid configuration
     */
    explicit Trainer(const TrainingConfig& config = TrainingConfig{},
                     std::shared_ptr<const text::Vocabulary> vocabulary = nullptr);

    /**
     * Called every config.progress_interval lines read.
     */
    void set_progress_callback(TrainingProgressCallback callback) {
        progress_ = std::move(callback);
    }

    /**
     * Feed one corpus line.
     * @return false once max_lines has been reached (line not consumed)
     */
    bool add(std::string_view line);

    /**
     * Train on every line of a stream.
     */
    void train(std::istream& in);

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    void train_file(const std::string& path);

    void train_multiple(const std::vector<std::string>& paths) {
        for (const auto& path : paths) {
            train_file(path);
        }
    }

    /**
     * Train on any range of string-like lines.
     */
    template <typename Range>
    void train_range(const Range& lines) {
        for (const auto& line : lines) {
            if (!add(line)) break;
        }
    }

    /**
     * Freeze the counts into an immutable model. The trainer stays usable.
     */
    PCFGModel build_model() const;

    const TrainingStats& stats() const { return stats_; }
    const FrequencyTable& table() const { return table_; }

private:
    TrainingConfig config_;
    std::shared_ptr<const text::Vocabulary> vocabulary_;
    text::Normalizer normalizer_;
    text::Tokenizer tokenizer_;
    FrequencyTable table_;
    TrainingStats stats_;
    TrainingProgressCallback progress_;

    void skip(SkipReason reason, std::string_view detail);
};

/**
 * One-shot training over a range of lines.
 */
template <typename Range>
PCFGModel fit(const Range& lines, const TrainingConfig& config = TrainingConfig{},
              std::shared_ptr<const text::Vocabulary> vocabulary = nullptr) {
    Trainer trainer(config, std::move(vocabulary));
    trainer.train_range(lines);
    return trainer.build_model();
}

}  // namespace pcfg
}  // namespace passgram
