/**
 * passgram - Password grammar trainer and candidate generator
 *
 * Learns a probabilistic grammar of password structure from a leaked corpus
 * and turns it into ordered guess lists for a downstream cracking stage.
 *
 * Usage:
 *   passgram <command> [options]
 *
 * Commands:
 *   train      Learn a model from one or more corpus files
 *   generate   Write deterministic, stochastic and combined candidate lists
 *   score      Print the log-probability of passwords under a model
 *   inspect    Show model statistics and the most frequent structures
 *
 * Example:
 *   passgram train -i rockyou.txt -o models/rockyou.pgm
 *   passgram generate -m models/rockyou.pgm -o generated/
 */

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <future>
#include <iomanip>
#include <memory>
#include <sstream>
#include <algorithm>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "core/yaml_config.hpp"
#include "text/vocabulary.hpp"
#include "pcfg/model.hpp"
#include "pcfg/trainer.hpp"
#include "pcfg/snapshot.hpp"
#include "pcfg/scorer.hpp"
#include "generators/beam_generator.hpp"
#include "generators/sampling_generator.hpp"
#include "generators/aggregator.hpp"
#include "io/candidate_file.hpp"

using namespace passgram;

constexpr const char* PASSGRAM_VERSION = "1.0.0";

/**
 * Command-line arguments, seeded from the config file.
 */
struct Arguments {
    std::string command;                  // train | generate | score | inspect
    bool help = false;
    bool verbose = false;
    bool debug = false;

    // Training
    TrainingConfig training;
    std::vector<std::string> corpus_files;

    // Generation
    GenerationConfig generation;
    std::string output_dir;

    // Shared
    std::string model_path;
    std::string vocabulary;               // Empty = no vocabulary
    std::string log_dir;                  // Empty = ~/.passgram
    std::string config_file;              // Empty = ./passgram.yml or ~/.passgram/config.yml

    // score / inspect
    std::vector<std::string> passwords;
    size_t top_n = 10;
};

/**
 * Find --config before anything else so the file can seed the defaults.
 */
std::string find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            return argv[i + 1];
        }
    }
    return "";
}

size_t parse_count(const std::string& flag, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw ConfigError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(flag + " expects a non-negative integer, got '" + value + "'");
        }
        return static_cast<size_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(flag + " expects a non-negative integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(flag + " is out of range: " + value);
    }
}

double parse_real(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(flag + " expects a number, got '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError(flag + " expects a number, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(flag + " is out of range: " + value);
    }
}

/**
 * Parse command-line arguments on top of the config file values.
 *
 * @throws ConfigError on unknown options or bad values
 */
Arguments parse_args(int argc, char* argv[], const AppConfig& config) {
    Arguments args;
    args.training = config.training;
    args.generation = config.generation;
    args.corpus_files = config.corpus_files;
    args.model_path = config.model_path;
    args.output_dir = config.output_dir;
    args.vocabulary = config.vocabulary;
    args.log_dir = config.log_dir;
    args.verbose = config.verbose;
    args.debug = config.debug;

    int i = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.command = argv[1];
        i = 2;
    }

    const bool training = args.command == "train";
    bool cli_corpus = false;

    auto value_of = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError(flag + " requires a value");
        }
        return argv[++i];
    };

    for (; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--debug") {
            args.debug = true;
        } else if (arg == "--config" || arg == "-c") {
            args.config_file = value_of(arg);
        } else if (arg == "--log-dir") {
            args.log_dir = value_of(arg);
        } else if (arg == "--vocab") {
            args.vocabulary = value_of(arg);
        } else if (arg == "--input" || arg == "-i") {
            if (!cli_corpus) {
                args.corpus_files.clear();
                cli_corpus = true;
            }
            args.corpus_files.push_back(value_of(arg));
        } else if (arg == "--model" || arg == "-m") {
            args.model_path = value_of(arg);
        } else if (arg == "--output" || arg == "-o") {
            // train writes a model file, generate writes into a directory
            if (training) {
                args.model_path = value_of(arg);
            } else {
                args.output_dir = value_of(arg);
            }
        } else if (arg == "--min-length") {
            if (training) {
                args.training.min_length = parse_count(arg, value_of(arg));
            } else {
                args.generation.bounds.min_length = parse_count(arg, value_of(arg));
            }
        } else if (arg == "--max-length") {
            if (training) {
                args.training.max_length = parse_count(arg, value_of(arg));
            } else {
                args.generation.bounds.max_length = parse_count(arg, value_of(arg));
            }
        } else if (arg == "--alpha") {
            args.training.alpha = parse_real(arg, value_of(arg));
        } else if (arg == "--no-leet") {
            args.training.leet = false;
        } else if (arg == "--min-word-length") {
            args.training.min_word_length = parse_count(arg, value_of(arg));
        } else if (arg == "--max-lines") {
            args.training.max_lines = parse_count(arg, value_of(arg));
        } else if (arg == "--trim-top") {
            args.training.trim_top_n = parse_count(arg, value_of(arg));
        } else if (arg == "--topk-templates") {
            args.generation.beam.topk_templates = parse_count(arg, value_of(arg));
        } else if (arg == "--topk-per-slot") {
            args.generation.beam.topk_per_slot = parse_count(arg, value_of(arg));
        } else if (arg == "--beam-width") {
            args.generation.beam.width = parse_count(arg, value_of(arg));
        } else if (arg == "--max-per-template") {
            args.generation.beam.max_per_template = parse_count(arg, value_of(arg));
        } else if (arg == "--max-total") {
            args.generation.beam.max_total = parse_count(arg, value_of(arg));
        } else if (arg == "--threads" || arg == "-t") {
            args.generation.beam.threads = parse_count(arg, value_of(arg));
        } else if (arg == "--samples") {
            args.generation.sampling.num_samples = parse_count(arg, value_of(arg));
        } else if (arg == "--seed") {
            args.generation.sampling.seed = parse_count(arg, value_of(arg));
        } else if (arg == "--top") {
            args.top_n = parse_count(arg, value_of(arg));
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("Unknown option: " + arg);
        } else if (args.command == "score") {
            args.passwords.push_back(arg);
        } else {
            throw ConfigError("Unexpected argument: " + arg);
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "passgram " << PASSGRAM_VERSION << "\n";
    std::cout << "==============\n\n";
    std::cout << "Probabilistic password grammar trainer and candidate generator.\n\n";

    std::cout << "Usage:\n";
    std::cout << "  passgram <command> [options]\n\n";

    std::cout << R"(Commands:
  train                   Learn a model from corpus files
  generate                Write candidate lists from a model
  score <password>...     Print log-probabilities under a model
  inspect                 Show model statistics

Training Options:
  --input, -i <file>      Corpus file, one password per line (repeatable)
  --output, -o <file>     Model snapshot to write (default: ./models/passgram.pgm)
  --min-length <n>        Skip shorter corpus lines (default: no filter)
  --max-length <n>        Skip longer corpus lines (default: no filter)
  --alpha <x>             Additive smoothing strength (default: 1.0)
  --no-leet               Disable leet-speak normalization
  --min-word-length <n>   Shortest letter run counted as a word (default: 3)
  --max-lines <n>         Stop after n corpus lines
  --trim-top <n>          Keep only the n most frequent values per token type

Generation Options:
  --model, -m <file>      Model snapshot (default: ./models/passgram.pgm)
  --output, -o <dir>      Output directory (default: ./generated)
  --min-length <n>        Shortest candidate emitted (default: 6)
  --max-length <n>        Longest candidate emitted (default: 64)
  --topk-templates <n>    Templates expanded by beam search (default: 40)
  --topk-per-slot <n>     Values considered per slot (default: 300)
  --beam-width <n>        Partials kept after each slot (default: 2000)
  --max-per-template <n>  Candidates kept per template (default: 2000)
  --max-total <n>         Deterministic candidate cap (default: 200000)
  --threads, -t <n>       Templates expanded concurrently (default: 1)
  --samples <n>           Stochastic draws (default: 3000)
  --seed <n>              Sampling seed (default: 42)

Inspect Options:
  --top <n>               Entries listed per table (default: 10)

Other:
  --vocab <file>          Word list deciding WORD vs FRAG letter runs
  --config, -c <file>     Config file (default: ./passgram.yml)
  --log-dir <dir>         Log directory (default: ~/.passgram)
  --verbose, -v           Verbose output
  --debug                 Debug logging
  --help, -h              Show this help message

Examples:
)";

    std::cout << R"(  passgram train -i rockyou.txt -i linkedin.txt -o models/big.pgm
  passgram generate -m models/big.pgm -o generated/ --samples 100000
  passgram score -m models/big.pgm password1 letmein
  passgram inspect -m models/big.pgm --top 20
)";
}

/**
 * Format large numbers with commas.
 */
std::string format_number(uint64_t n) {
    if (n == 0) return "0";

    std::string result;
    result.reserve(26);

    int digit_count = 0;
    while (n > 0) {
        if (digit_count > 0 && digit_count % 3 == 0) {
            result.push_back(',');
        }
        result.push_back('0' + (n % 10));
        n /= 10;
        digit_count++;
    }

    std::reverse(result.begin(), result.end());
    return result;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::shared_ptr<const text::Vocabulary> load_vocabulary(const Arguments& args) {
    if (args.vocabulary.empty()) {
        return nullptr;
    }
    auto vocab = std::make_shared<text::Vocabulary>(text::Vocabulary::load(args.vocabulary));
    std::cout << "[*] Vocabulary: " << args.vocabulary << " ("
              << format_number(vocab->size()) << " words)\n";
    return vocab;
}

pcfg::PCFGModel load_model(const Arguments& args) {
    std::cout << "[*] Loading model: " << args.model_path << "\n";
    pcfg::PCFGModel model = pcfg::load_snapshot(args.model_path);
    if (args.verbose) {
        std::cout << "    Examples: " << format_number(model.total_examples())
                  << ", templates: " << format_number(model.table().templates().size()) << "\n";
    }
    return model;
}

// =============================================================================
// COMMANDS
// =============================================================================

int run_train(const Arguments& args) {
    if (args.corpus_files.empty()) {
        throw ConfigError("train requires at least one --input corpus file");
    }
    if (args.model_path.empty()) {
        throw ConfigError("train requires --output <model>");
    }

    auto vocab = load_vocabulary(args);
    pcfg::Trainer trainer(args.training, vocab);

    auto& logger = Logger::instance();
    trainer.set_progress_callback([&](const pcfg::TrainingStats& stats) {
        std::cout << "\r[*] Read " << format_number(stats.lines_read) << " lines, "
                  << format_number(stats.processed) << " processed" << std::flush;
        logger.log_training_progress(stats.lines_read, stats.processed, stats.skipped());
    });

    auto start = std::chrono::steady_clock::now();
    for (const auto& path : args.corpus_files) {
        std::cout << "[*] Training on: " << path << "\n";
        PASSGRAM_LOG_INFO("Training on " + path);
        trainer.train_file(path);
    }

    const auto& stats = trainer.stats();
    if (stats.lines_read >= args.training.progress_interval) {
        std::cout << "\n";
    }

    pcfg::PCFGModel model = trainer.build_model();
    if (!model.trained()) {
        throw ModelNotTrainedError("No usable passwords found in the corpus");
    }

    pcfg::save_snapshot(model, args.model_path);
    double elapsed = seconds_since(start);
    logger.log_training_complete(stats.processed, stats.skipped(), stats.filtered_length,
                                 model.table().templates().size(), elapsed);

    std::cout << "[+] Model written: " << args.model_path << "\n";
    std::cout << "    Lines read:       " << format_number(stats.lines_read) << "\n";
    std::cout << "    Processed:        " << format_number(stats.processed) << "\n";
    std::cout << "    Skipped:          " << format_number(stats.skipped())
              << " (empty " << format_number(stats.skipped_empty)
              << ", malformed " << format_number(stats.skipped_malformed) << ")\n";
    std::cout << "    Length filtered:  " << format_number(stats.filtered_length) << "\n";
    std::cout << "    Unique templates: " << format_number(model.table().templates().size()) << "\n";
    std::cout << "    Elapsed:          " << std::fixed << std::setprecision(1) << elapsed << "s\n";
    return 0;
}

int run_generate(const Arguments& args) {
    validate(args.generation);

    pcfg::PCFGModel model = load_model(args);
    auto vocab = load_vocabulary(args);
    pcfg::Scorer scorer(model, vocab);

    auto& logger = Logger::instance();
    const GenerationConfig& config = args.generation;

    // Sampling is independent of the beam; run it alongside
    double sampling_elapsed = 0.0;
    auto sampling = std::async(std::launch::async, [&scorer, &config, &sampling_elapsed]() {
        auto start = std::chrono::steady_clock::now();
        pcfg::SamplingGenerator generator(scorer, config.sampling);
        auto candidates = generator.generate();
        sampling_elapsed = seconds_since(start);
        return candidates;
    });

    std::cout << "[*] Beam search over " << config.beam.topk_templates << " templates ("
              << config.beam.threads << " thread" << (config.beam.threads == 1 ? "" : "s") << ")\n";
    auto beam_start = std::chrono::steady_clock::now();
    pcfg::BeamGenerator beam(scorer, config);
    std::vector<Candidate> deterministic = beam.generate();
    double beam_elapsed = seconds_since(beam_start);
    logger.log_generation("deterministic", deterministic.size(), beam_elapsed);

    std::vector<Candidate> stochastic = sampling.get();
    logger.log_generation("stochastic", stochastic.size(), sampling_elapsed);

    if (args.verbose) {
        const auto& bs = beam.stats();
        std::cout << "    Templates expanded: " << bs.templates_expanded
                  << ", pruned: " << format_number(bs.partials_pruned)
                  << ", rejected: " << format_number(bs.rejected) << "\n";
    }

    Aggregator det_only(config.bounds);
    det_only.add(deterministic);
    Aggregator sto_only(config.bounds);
    sto_only.add(stochastic);

    AggregateStats combined_stats;
    std::vector<std::string> combined = combine(deterministic, stochastic, config.bounds, &combined_stats);

    std::filesystem::path dir(args.output_dir);
    std::string det_path = (dir / "candidates_det.txt").string();
    std::string sto_path = (dir / "candidates_sto.txt").string();
    std::string combined_path = (dir / "candidates_combined.txt").string();

    write_candidates(det_path, det_only.result());
    write_candidates(sto_path, sto_only.result());
    write_candidates(combined_path, combined);

    std::cout << "[+] Deterministic: " << format_number(det_only.result().size())
              << " candidates -> " << det_path << "\n";
    std::cout << "[+] Stochastic:    " << format_number(sto_only.result().size())
              << " candidates (" << format_number(stochastic.size()) << " draws) -> " << sto_path << "\n";
    std::cout << "[+] Combined:      " << format_number(combined.size())
              << " candidates (" << format_number(combined_stats.duplicates) << " duplicates, "
              << format_number(combined_stats.out_of_range) << " out of range) -> " << combined_path << "\n";

    PASSGRAM_LOG_INFO("Combined " + std::to_string(combined_stats.input) + " candidates into " +
                      std::to_string(combined_stats.output));
    return 0;
}

int run_score(const Arguments& args) {
    if (args.passwords.empty()) {
        throw ConfigError("score requires at least one password");
    }

    pcfg::PCFGModel model = load_model(args);
    auto vocab = load_vocabulary(args);
    pcfg::Scorer scorer(model, vocab);

    int status = 0;
    for (const auto& password : args.passwords) {
        try {
            pcfg::ScoredParse scored = scorer.score_parse(password);
            std::cout << std::fixed << std::setprecision(6) << scored.score << "\t" << password;
            if (args.verbose) {
                std::cout << "\t" << scored.parse.label();
            }
            std::cout << "\n";
        } catch (const InvalidInputError& e) {
            std::cerr << "[!] " << password << ": " << e.what() << "\n";
            PASSGRAM_LOG_ERROR(std::string("Cannot score input: ") + e.what());
            status = 1;
        }
    }
    return status;
}

int run_inspect(const Arguments& args) {
    pcfg::PCFGModel model = load_model(args);
    const auto& table = model.table();
    const auto& settings = model.settings();

    std::cout << "\nModel\n";
    std::cout << "  Schema version:    " << model.schema_version() << "\n";
    std::cout << "  Alpha:             " << model.alpha() << "\n";
    std::cout << "  Examples:          " << format_number(model.total_examples()) << "\n";
    std::cout << "  Unique templates:  " << format_number(table.templates().size()) << "\n";
    std::cout << "  Leet:              " << (settings.leet ? "on" : "off") << "\n";
    std::cout << "  Min word length:   " << settings.min_word_length << "\n";
    std::cout << "  Vocabulary:        ";
    if (settings.vocabulary_fingerprint == 0) {
        std::cout << "none\n";
    } else {
        std::cout << std::hex << std::setw(16) << std::setfill('0') << settings.vocabulary_fingerprint
                  << std::dec << std::setfill(' ') << "\n";
    }

    std::cout << "\nTop templates\n";
    const auto& templates = model.ranked_templates();
    for (size_t i = 0; i < templates.size() && i < args.top_n; ++i) {
        double p = std::exp(model.template_log_prob(templates[i].label));
        std::cout << "  " << std::setw(12) << format_number(templates[i].count) << "  "
                  << std::fixed << std::setprecision(4) << std::setw(7) << p * 100.0 << "%  "
                  << templates[i].label << "\n";
    }

    for (TokenType type : ALL_TOKEN_TYPES) {
        const auto& values = table.tokens(type);
        std::cout << "\n" << token_type_name(type) << " (" << format_number(values.size())
                  << " unique, " << format_number(table.token_total(type)) << " total)\n";

        std::vector<std::pair<std::string, uint64_t>> ranked(values.begin(), values.end());
        size_t shown = std::min(args.top_n, ranked.size());
        std::partial_sort(ranked.begin(), ranked.begin() + shown, ranked.end(),
                          [](const auto& a, const auto& b) {
                              if (a.second != b.second) return a.second > b.second;
                              return a.first < b.first;
                          });
        for (size_t i = 0; i < shown; ++i) {
            std::cout << "  " << std::setw(12) << format_number(ranked[i].second) << "  "
                      << ranked[i].first << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    // Load config file (passgram.yml in current directory or ~/.passgram/config.yml)
    // Command-line arguments take precedence over config file
    std::string config_file = find_config_arg(argc, argv);
    AppConfig app_config;
    if (!app_config.load(config_file) && !config_file.empty()) {
        return 1;
    }

    Arguments args;
    try {
        args = parse_args(argc, argv, app_config);
    } catch (const ConfigError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        std::cerr << "    Run 'passgram --help' for usage.\n";
        return 1;
    }

    if (args.help) {
        print_usage();
        return 0;
    }
    if (args.command.empty()) {
        print_usage();
        return 1;
    }

    auto& logger = Logger::instance();
    auto level = (args.verbose || args.debug) ? Logger::Level::DEBUG : Logger::Level::INFO;
    if (logger.init(args.log_dir, level)) {
        PASSGRAM_LOG_INFO(std::string("Starting passgram v") + PASSGRAM_VERSION + " command=" + args.command);
        if (args.verbose) {
            std::cout << "[*] Logging to " << logger.get_log_path() << "\n";
        }
    } else if (args.verbose) {
        std::cerr << "[!] Could not open log file, continuing without logging\n";
    }

    try {
        if (args.command == "train") return run_train(args);
        if (args.command == "generate") return run_generate(args);
        if (args.command == "score") return run_score(args);
        if (args.command == "inspect") return run_inspect(args);

        std::cerr << "[!] Unknown command: " << args.command << "\n";
        std::cerr << "    Run 'passgram --help' for usage.\n";
        return 1;
    } catch (const SnapshotCorruptError& e) {
        std::cerr << "[!] Model snapshot rejected: " << e.what() << "\n";
        PASSGRAM_LOG_ERROR(std::string("Snapshot rejected: ") + e.what());
    } catch (const Error& e) {
        std::cerr << "[!] " << e.what() << "\n";
        logger.log_error(e.what());
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        logger.log_error(e.what());
    }
    return 1;
}
