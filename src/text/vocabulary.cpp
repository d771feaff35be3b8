/**
 * Vocabulary Implementation
 */

#include "vocabulary.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#define XXH_INLINE_ALL
#include "xxhash.h"

namespace passgram {
namespace text {

Vocabulary Vocabulary::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file: " + path);
    }
    return load(file);
}

Vocabulary Vocabulary::load(std::istream& in) {
    Vocabulary vocab;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        vocab.add(line);
    }
    return vocab;
}

void Vocabulary::add(std::string_view word) {
    std::string lower(word);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
    });
    if (!lower.empty()) words_.insert(std::move(lower));
}

uint64_t Vocabulary::fingerprint() const {
    if (words_.empty()) return 0;

    std::vector<const std::string*> sorted;
    sorted.reserve(words_.size());
    for (const auto& word : words_) sorted.push_back(&word);
    std::sort(sorted.begin(), sorted.end(),
              [](const std::string* a, const std::string* b) { return *a < *b; });

    XXH3_state_t state;
    XXH3_64bits_reset(&state);
    const char separator = '\n';
    for (const auto* word : sorted) {
        XXH3_64bits_update(&state, word->data(), word->size());
        XXH3_64bits_update(&state, &separator, 1);
    }
    return XXH3_64bits_digest(&state);
}

}  // namespace text
}  // namespace passgram
