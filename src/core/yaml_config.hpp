/**
 * yaml_config.hpp - Simple YAML configuration loader for passgram
 *
 * Parses a subset of YAML (key: value pairs with one level of sections)
 * without external dependencies. Command-line arguments override config file
 * settings. The option names MIN_PASSWORD_LENGTH, BEAM_TOPK_TEMPLATES, ...
 * are also accepted as top-level keys.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include "config.hpp"
#include "logger.hpp"

namespace passgram {

/**
 * Application configuration loaded from passgram.yml
 */
struct AppConfig {
    TrainingConfig training;
    GenerationConfig generation;

    // Paths
    std::vector<std::string> corpus_files;
    std::string model_path = "./models/passgram.pgm";
    std::string output_dir = "./generated";
    std::string vocabulary;
    std::string log_dir;             // Empty = ~/.passgram

    // Settings
    bool verbose = false;
    bool debug = false;

    // Problems found while parsing, one entry per offending line
    std::vector<std::string> warnings;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./passgram.yml");
        paths.push_back("./passgram.yaml");

        // 2. User home directory
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : "";
        if (!home.empty()) {
            paths.push_back(home + "/.passgram/config.yml");
            paths.push_back(home + "/.passgram/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from a YAML file.
     * Returns true if a config file was found and loaded.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;

        if (!explicit_path.empty()) {
            if (std::filesystem::exists(explicit_path)) {
                config_path = explicit_path;
            } else {
                std::cerr << "[!] Config file not found: " << explicit_path << "\n";
                return false;
            }
        } else {
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::exists(path)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[!] Failed to open config file: " << config_path << "\n";
            return false;
        }

        std::cout << "[*] Loading config from: " << config_path << "\n";
        load(file);

        for (const auto& warning : warnings) {
            std::cerr << "[!] " << config_path << ": " << warning << "\n";
            PASSGRAM_LOG_WARN(config_path + ": " + warning);
        }
        return true;
    }

    /**
     * Parse configuration text. Bad lines are recorded in warnings and skipped.
     */
    void load(std::istream& in) {
        std::string line;
        std::string current_section;
        int line_number = 0;

        while (std::getline(in, line)) {
            line_number++;

            // Trim leading whitespace and count indent
            size_t indent = 0;
            while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
                indent++;
            }
            std::string trimmed = line.substr(indent);

            // Skip empty lines, comments and document markers
            if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
                continue;
            }

            // Remove trailing comments (outside quotes)
            size_t comment_pos = find_comment(trimmed);
            if (comment_pos != std::string::npos) {
                trimmed = trimmed.substr(0, comment_pos);
            }

            while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' || trimmed.back() == '\r')) {
                trimmed.pop_back();
            }

            if (trimmed.empty()) continue;

            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                warnings.push_back("line " + std::to_string(line_number) + ": expected 'key: value'");
                continue;
            }

            std::string key = trimmed.substr(0, colon_pos);
            std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";

            while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

            // Section header (no value at indent 0)
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            // A top-level key ends the current section
            if (indent == 0) {
                current_section.clear();
            }

            // Remove quotes from string values
            if (value.length() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.length() - 2);
            }

            try {
                if (!parse_value(current_section, key, value)) {
                    std::string name = current_section.empty() ? key : current_section + "." + key;
                    warnings.push_back("line " + std::to_string(line_number) + ": unknown key '" + name + "'");
                }
            } catch (const std::exception& e) {
                warnings.push_back("line " + std::to_string(line_number) + ": bad value '" + value +
                                   "' for '" + key + "' (" + e.what() + ")");
            }
        }
    }

private:
    /**
     * Returns false for unknown keys; throws on unparseable values.
     */
    bool parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section.empty()) {
            return parse_option(key, value);
        }
        if (section == "training") {
            if (key == "min_length") training.min_length = parse_size(value);
            else if (key == "max_length") training.max_length = parse_size(value);
            else if (key == "alpha") training.alpha = std::stod(value);
            else if (key == "leet") training.leet = parse_bool(value);
            else if (key == "min_word_length") training.min_word_length = parse_size(value);
            else if (key == "max_lines") training.max_lines = parse_size(value);
            else if (key == "trim_top_n") training.trim_top_n = parse_size(value);
            else if (key == "trim_interval") training.trim_interval = parse_size(value);
            else if (key == "progress_interval") training.progress_interval = parse_size(value);
            else return false;
        }
        else if (section == "generation") {
            if (key == "min_password_length") generation.bounds.min_length = parse_size(value);
            else if (key == "max_password_length") generation.bounds.max_length = parse_size(value);
            else return false;
        }
        else if (section == "beam") {
            if (key == "topk_templates") generation.beam.topk_templates = parse_size(value);
            else if (key == "topk_per_slot") generation.beam.topk_per_slot = parse_size(value);
            else if (key == "width") generation.beam.width = parse_size(value);
            else if (key == "max_per_template") generation.beam.max_per_template = parse_size(value);
            else if (key == "max_total_candidates") generation.beam.max_total = parse_size(value);
            else if (key == "threads") generation.beam.threads = parse_size(value);
            else return false;
        }
        else if (section == "stochastic") {
            if (key == "num_samples") generation.sampling.num_samples = parse_size(value);
            else if (key == "seed") generation.sampling.seed = parse_size(value);
            else return false;
        }
        else if (section == "paths") {
            if (key == "corpus") corpus_files = parse_list(value);
            else if (key == "model") model_path = value;
            else if (key == "output_dir") output_dir = value;
            else if (key == "vocabulary") vocabulary = value;
            else if (key == "log_dir") log_dir = value;
            else return false;
        }
        else if (section == "settings") {
            if (key == "verbose") verbose = parse_bool(value);
            else if (key == "debug") debug = parse_bool(value);
            else return false;
        }
        else {
            return false;
        }
        return true;
    }

    bool parse_option(const std::string& key, const std::string& value) {
        if (key == "MIN_PASSWORD_LENGTH") generation.bounds.min_length = parse_size(value);
        else if (key == "MAX_PASSWORD_LENGTH") generation.bounds.max_length = parse_size(value);
        else if (key == "BEAM_TOPK_TEMPLATES") generation.beam.topk_templates = parse_size(value);
        else if (key == "BEAM_TOPK_PER_SLOT") generation.beam.topk_per_slot = parse_size(value);
        else if (key == "BEAM_WIDTH") generation.beam.width = parse_size(value);
        else if (key == "BEAM_MAX_PER_TEMPLATE") generation.beam.max_per_template = parse_size(value);
        else if (key == "BEAM_MAX_TOTAL_CANDIDATES") generation.beam.max_total = parse_size(value);
        else if (key == "STOCHASTIC_NUM_SAMPLES") generation.sampling.num_samples = parse_size(value);
        else if (key == "RNG_SEED") generation.sampling.seed = parse_size(value);
        else if (key == "ALPHA") training.alpha = std::stod(value);
        else return false;
        return true;
    }

    static size_t find_comment(const std::string& s) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
                return i;
            }
        }
        return std::string::npos;
    }

    static size_t parse_size(const std::string& value) {
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("expected a non-negative integer");
        }
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<size_t>(parsed);
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
        if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
        throw std::invalid_argument("expected a boolean");
    }

    static std::vector<std::string> parse_list(const std::string& value) {
        std::vector<std::string> result;

        if (value.empty() || value == "[]") return result;

        std::string clean = value;
        if (clean.front() == '[') clean.erase(0, 1);
        if (!clean.empty() && clean.back() == ']') clean.pop_back();

        std::stringstream ss(clean);
        std::string item;
        while (std::getline(ss, item, ',')) {
            while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.erase(0, 1);
            while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.pop_back();
            if (item.size() >= 2 && (item.front() == '"' || item.front() == '\'') && item.back() == item.front()) {
                item = item.substr(1, item.size() - 2);
            }
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }
};

}  // namespace passgram
