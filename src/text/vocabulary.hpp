/**
 * passgram Vocabulary
 *
 * Optional dictionary that decides whether a letter run is a WORD or a FRAG.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace passgram {
namespace text {

class Vocabulary {
public:
    Vocabulary() = default;

    /**
     * Load one word per line. Words are lowercased; blank lines and lines
     * starting with '#' are skipped.
     *
     * @throws std::runtime_error if the file cannot be opened
     */
    static Vocabulary load(const std::string& path);
    static Vocabulary load(std::istream& in);

    void add(std::string_view word);

    bool contains(const std::string& word) const {
        return words_.count(word) > 0;
    }

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    /**
     * XXH3-64 over the sorted word list; 0 for an empty vocabulary.
     * Stored in models so inference can verify it tokenizes like training did.
     */
    uint64_t fingerprint() const;

private:
    std::unordered_set<std::string> words_;
};

}  // namespace text
}  // namespace passgram
