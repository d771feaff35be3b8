/**
 * passgram Tokenizer
 *
 * Segments a normalized password into maximal character-class runs and
 * derives its template (WORD8|DIGITS1 ...).
 */

#pragma once

#include "../core/types.hpp"
#include "vocabulary.hpp"
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace passgram {
namespace text {

struct Tokenization {
    Template tmpl;
    std::vector<Token> tokens;

    std::string label() const { return tmpl.label(); }
};

enum class CharClass : uint8_t {
    LETTER,
    DIGIT,
    OTHER,
};

class Tokenizer {
public:
    /**
     * @param min_word_length letter runs shorter than this are FRAG
     * @param vocabulary when set, letter runs must also be listed to be WORD
     */
    explicit Tokenizer(size_t min_word_length = 3,
                       std::shared_ptr<const Vocabulary> vocabulary = nullptr)
        : min_word_length_(min_word_length), vocabulary_(std::move(vocabulary)) {}

    /**
     * Pure; concatenating the returned token values reproduces the input.
     *
     * @throws InvalidInputError on empty input
     */
    Tokenization tokenize(std::string_view normalized) const;

    static CharClass classify(unsigned char c) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return CharClass::LETTER;
        if (c >= '0' && c <= '9') return CharClass::DIGIT;
        return CharClass::OTHER;
    }

    size_t min_word_length() const { return min_word_length_; }
    const Vocabulary* vocabulary() const { return vocabulary_.get(); }

private:
    size_t min_word_length_;
    std::shared_ptr<const Vocabulary> vocabulary_;

    TokenType letter_run_type(const std::string& run) const;
};

}  // namespace text
}  // namespace passgram
