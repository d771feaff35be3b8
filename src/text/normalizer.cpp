/**
 * Normalizer Implementation
 */

#include "normalizer.hpp"
#include "../core/errors.hpp"

namespace passgram {
namespace text {

namespace {

bool is_lower(unsigned char c) { return c >= 'a' && c <= 'z'; }
bool is_letter(unsigned char c) { return is_lower(c) || (c >= 'A' && c <= 'Z'); }

}  // namespace

const LeetTable& Normalizer::default_table() {
    static const LeetTable table = {
        {'0', 'o'}, {'1', 'l'}, {'3', 'e'}, {'4', 'a'}, {'5', 's'},
        {'7', 't'}, {'@', 'a'}, {'$', 's'}, {'!', 'i'},
    };
    return table;
}

Normalizer::Normalizer(const LeetTable& table, bool leet) : leet_(leet) {
    for (const auto& [from, to] : table) {
        auto key = static_cast<unsigned char>(from);
        auto value = static_cast<unsigned char>(to);
        if (is_letter(key) || key < 0x20 || key == 0x7F) {
            throw InvalidInputError(std::string("Leet table key must be a non-letter printable character: '") + from + "'");
        }
        if (!is_lower(value)) {
            throw InvalidInputError(std::string("Leet table value must be a lowercase letter: '") + to + "'");
        }
        map_[key] = to;
    }
}

void require_text(std::string_view password) {
    if (password.empty()) {
        throw InvalidInputError("Empty password");
    }
    for (size_t i = 0; i < password.size(); ++i) {
        auto c = static_cast<unsigned char>(password[i]);
        if (c < 0x20 || c == 0x7F) {
            throw InvalidInputError("Control byte at offset " + std::to_string(i));
        }
    }
}

std::string Normalizer::normalize(std::string_view password) const {
    require_text(password);

    std::string result(password);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }

    if (!leet_) return result;

    size_t i = 0;
    while (i < result.size()) {
        if (map_[static_cast<unsigned char>(result[i])] == 0) {
            ++i;
            continue;
        }

        // Maximal run of substitutable characters
        size_t end = i;
        while (end < result.size() && map_[static_cast<unsigned char>(result[end])] != 0) {
            ++end;
        }

        bool letter_before = i > 0 && is_lower(static_cast<unsigned char>(result[i - 1]));
        bool letter_after = end < result.size() && is_lower(static_cast<unsigned char>(result[end]));

        if (letter_before && letter_after) {
            for (size_t j = i; j < end; ++j) {
                result[j] = map_[static_cast<unsigned char>(result[j])];
            }
        }
        i = end;
    }

    return result;
}

}  // namespace text
}  // namespace passgram
