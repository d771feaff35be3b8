/**
 * passgram Errors
 *
 * Exception hierarchy shared by every stage. Per-line training problems are
 * not exceptions; the trainer counts them (see pcfg::SkipReason).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace passgram {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Empty or non-text input handed to the normalizer or tokenizer.
 * Always recoverable by the caller.
 */
class InvalidInputError : public Error {
public:
    using Error::Error;
};

/**
 * Snapshot failed magic, version, structure or checksum validation.
 */
class SnapshotCorruptError : public Error {
public:
    using Error::Error;
};

/**
 * Scoring or generation attempted against an empty model.
 */
class ModelNotTrainedError : public Error {
public:
    using Error::Error;
};

/**
 * Inconsistent configuration values.
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace passgram
