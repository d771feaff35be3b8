/**
 * passgram Normalizer
 *
 * Canonicalizes password text before structural analysis: ASCII case folding
 * plus leet-speak substitution (p@55w0rd -> password).
 */

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace passgram {
namespace text {

/**
 * Leet character -> canonical lowercase letter.
 */
using LeetTable = std::vector<std::pair<char, char>>;

/**
 * Stateless after construction; safe to share between threads.
 *
 * A maximal run of leet characters is substituted only when a letter sits
 * directly on both sides of the run. That keeps trailing digits digits
 * ("password1") while folding embedded ones ("letme1n" -> "letmeln"), and
 * makes normalize() idempotent. Output length always equals input length.
 */
class Normalizer {
public:
    /**
     * 0->o 1->l 3->e 4->a 5->s 7->t @->a $->s !->i
     */
    static const LeetTable& default_table();

    /**
     * @throws InvalidInputError if a key is a letter or a value is not a
     *         lowercase letter
     */
    explicit Normalizer(const LeetTable& table = default_table(), bool leet = true);

    /**
     * @throws InvalidInputError on empty input or control bytes
     */
    std::string normalize(std::string_view password) const;

    bool leet_enabled() const { return leet_; }

private:
    std::array<char, 256> map_{};  // 0 = no substitution
    bool leet_;
};

/**
 * Reject empty strings and strings containing ASCII control bytes.
 *
 * @throws InvalidInputError
 */
void require_text(std::string_view password);

}  // namespace text
}  // namespace passgram
