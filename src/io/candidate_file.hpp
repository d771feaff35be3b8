/**
 * passgram Candidate Files
 *
 * Newline-delimited candidate artifacts handed to the cracking stage.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace passgram {

/**
 * One candidate per line.
 *
 * @throws InvalidInputError if a candidate contains '\n' or '\r'
 * @throws std::runtime_error if the stream fails
 */
size_t write_candidates(std::ostream& out, const std::vector<std::string>& candidates);

/**
 * Writes <path>.tmp then renames it over path, creating parent directories.
 */
size_t write_candidates(const std::string& path, const std::vector<std::string>& candidates);

/**
 * Read an artifact back; blank lines and trailing '\r' are dropped.
 *
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<std::string> read_candidates(const std::string& path);

}  // namespace passgram
