/**
 * Tokenizer Implementation
 */

#include "tokenizer.hpp"
#include "../core/errors.hpp"

namespace passgram {
namespace text {

TokenType Tokenizer::letter_run_type(const std::string& run) const {
    if (run.size() < min_word_length_) return TokenType::FRAG;
    if (vocabulary_ && !vocabulary_->contains(run)) return TokenType::FRAG;
    return TokenType::WORD;
}

Tokenization Tokenizer::tokenize(std::string_view normalized) const {
    if (normalized.empty()) {
        throw InvalidInputError("Cannot tokenize an empty string");
    }

    Tokenization result;
    size_t start = 0;
    CharClass current = classify(static_cast<unsigned char>(normalized[0]));

    auto flush = [&](size_t end) {
        Token token;
        token.value = std::string(normalized.substr(start, end - start));
        token.length = token.value.size();
        switch (current) {
            case CharClass::LETTER: token.type = letter_run_type(token.value); break;
            case CharClass::DIGIT:  token.type = TokenType::DIGITS; break;
            case CharClass::OTHER:  token.type = TokenType::SYMBOL; break;
        }
        result.tmpl.slots.push_back({token.type, token.length});
        result.tokens.push_back(std::move(token));
    };

    for (size_t i = 1; i < normalized.size(); ++i) {
        CharClass cls = classify(static_cast<unsigned char>(normalized[i]));
        if (cls != current) {
            flush(i);
            start = i;
            current = cls;
        }
    }
    flush(normalized.size());

    return result;
}

}  // namespace text
}  // namespace passgram
