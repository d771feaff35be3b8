/**
 * passgram Model Snapshots
 *
 * Versioned, self-describing binary persistence for PCFGModel.
 *
 * Layout (host byte order):
 *   "PGRM" u32 schema_version
 *   "HEAD" f64 alpha, u64 total_examples, u8 leet, u32 min_word_length, u64 vocabulary_fingerprint
 *   "TMPL" u64 n, n x (u32 len, bytes, u64 count)             sorted by label
 *   "TOKN" u8 types, types x (u8 type, u64 n, n x entry)       sorted by value
 *   "END " u64 XXH3-64 of every preceding byte
 *
 * Labels and token values are 1..MAX_ENTRY_BYTES bytes. Readers never
 * migrate: any mismatch raises SnapshotCorruptError.
 */

#pragma once

#include "model.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace passgram {
namespace pcfg {

/**
 * @throws InvalidInputError if a label or token value is empty or longer than MAX_ENTRY_BYTES
 * @throws std::runtime_error if the stream fails
 */
void save_snapshot(const PCFGModel& model, std::ostream& out);

/**
 * Writes <path>.tmp then renames it over path.
 *
 * @throws std::runtime_error on I/O failure
 */
void save_snapshot(const PCFGModel& model, const std::string& path);

/**
 * @throws SnapshotCorruptError on any magic, version, structure or checksum mismatch
 */
PCFGModel load_snapshot(std::istream& in);

/**
 * @throws std::runtime_error if the file cannot be opened
 * @throws SnapshotCorruptError as above
 */
PCFGModel load_snapshot(const std::string& path);

}  // namespace pcfg
}  // namespace passgram
