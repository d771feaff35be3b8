/**
 * passgram Core Types
 *
 * Common type definitions shared by the tokenizer, the grammar model and
 * the candidate generators.
 */

#pragma once

#include "errors.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace passgram {

// -----------------------------------------------------------------------------
// Token Types
// -----------------------------------------------------------------------------

/**
 * Character-class of a token inside a normalized password.
 * The numeric values are persisted in model snapshots.
 */
enum class TokenType : uint8_t {
    WORD = 0,    // Letter run long enough (and known) to count as a word
    FRAG = 1,    // Any other letter run
    DIGITS = 2,  // Digit run
    SYMBOL = 3,  // Everything else, including non-ASCII bytes
};

constexpr size_t NUM_TOKEN_TYPES = 4;

constexpr TokenType ALL_TOKEN_TYPES[NUM_TOKEN_TYPES] = {
    TokenType::WORD, TokenType::FRAG, TokenType::DIGITS, TokenType::SYMBOL
};

/**
 * Longest template label or token value a model stores. Training skips
 * lines that would exceed it and snapshots refuse anything longer.
 */
constexpr size_t MAX_ENTRY_BYTES = 4096;

inline const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::WORD:   return "WORD";
        case TokenType::FRAG:   return "FRAG";
        case TokenType::DIGITS: return "DIGITS";
        case TokenType::SYMBOL: return "SYMBOL";
    }
    return "?";
}

inline size_t token_type_index(TokenType type) {
    return static_cast<size_t>(type);
}

/**
 * A maximal run of one character class.
 */
struct Token {
    TokenType type;
    std::string value;
    size_t length;

    bool operator==(const Token& other) const = default;
};

/**
 * One position of a template: the token type and its length in bytes.
 */
struct Slot {
    TokenType type;
    size_t length;

    bool operator==(const Slot& other) const = default;
};

/**
 * Structural shape of a password, e.g. WORD8|DIGITS3|SYMBOL1.
 */
struct Template {
    std::vector<Slot> slots;

    bool operator==(const Template& other) const = default;

    bool empty() const { return slots.empty(); }
    size_t size() const { return slots.size(); }

    /**
     * Sum of the slot lengths (templates fix every slot length).
     */
    size_t total_length() const {
        size_t total = 0;
        for (const auto& slot : slots) total += slot.length;
        return total;
    }

    /**
     * Render as a label: slots joined by '|'.
     */
    std::string label() const {
        std::string result;
        for (const auto& slot : slots) {
            if (!result.empty()) result += '|';
            result += token_type_name(slot.type);
            result += std::to_string(slot.length);
        }
        return result;
    }

    /**
     * Parse a label produced by label().
     *
     * @throws InvalidInputError if the label is malformed
     */
    static Template parse(std::string_view label) {
        if (label.empty()) {
            throw InvalidInputError("Empty template label");
        }

        Template result;
        size_t start = 0;
        while (start <= label.size()) {
            size_t end = label.find('|', start);
            if (end == std::string_view::npos) end = label.size();
            std::string_view part = label.substr(start, end - start);

            size_t digits_at = part.find_first_of("0123456789");
            if (digits_at == std::string_view::npos || digits_at == 0) {
                throw InvalidInputError("Malformed template slot: " + std::string(part));
            }

            std::string_view name = part.substr(0, digits_at);
            std::string_view number = part.substr(digits_at);

            Slot slot{TokenType::SYMBOL, 0};
            bool known = false;
            for (TokenType type : ALL_TOKEN_TYPES) {
                if (name == token_type_name(type)) {
                    slot.type = type;
                    known = true;
                    break;
                }
            }
            if (!known) {
                throw InvalidInputError("Unknown token type in template: " + std::string(name));
            }

            if (number.size() > 6 || number.find_first_not_of("0123456789") != std::string_view::npos) {
                throw InvalidInputError("Malformed slot length: " + std::string(part));
            }
            slot.length = std::stoul(std::string(number));
            if (slot.length == 0) {
                throw InvalidInputError("Zero-length slot: " + std::string(part));
            }

            result.slots.push_back(slot);
            start = end + 1;
        }

        return result;
    }
};

// -----------------------------------------------------------------------------
// Candidate Types
// -----------------------------------------------------------------------------

/**
 * Which generation strategy produced a candidate.
 */
enum class CandidateSource : uint8_t {
    DETERMINISTIC = 0,  // Beam search
    STOCHASTIC = 1,     // Weighted sampling
};

inline const char* candidate_source_name(CandidateSource source) {
    return source == CandidateSource::DETERMINISTIC ? "deterministic" : "stochastic";
}

/**
 * A generated password candidate.
 */
struct Candidate {
    std::string text;
    CandidateSource source;
    std::optional<double> score;  // Log-probability, when computed
};

}  // namespace passgram
