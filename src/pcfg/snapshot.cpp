/**
 * Model Snapshot Implementation
 */

#include "snapshot.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include "../text/tokenizer.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#define XXH_INLINE_ALL
#include "xxhash.h"

namespace passgram {
namespace pcfg {

namespace {

constexpr char MAGIC[4] = {'P', 'G', 'R', 'M'};
constexpr char TAG_HEADER[4] = {'H', 'E', 'A', 'D'};
constexpr char TAG_TEMPLATES[4] = {'T', 'M', 'P', 'L'};
constexpr char TAG_TOKENS[4] = {'T', 'O', 'K', 'N'};
constexpr char TAG_END[4] = {'E', 'N', 'D', ' '};

/**
 * Whether every byte of value belongs to the character class of type.
 */
bool matches_class(TokenType type, const std::string& value) {
    text::CharClass expected = text::CharClass::OTHER;
    if (type == TokenType::WORD || type == TokenType::FRAG) expected = text::CharClass::LETTER;
    if (type == TokenType::DIGITS) expected = text::CharClass::DIGIT;
    return std::all_of(value.begin(), value.end(), [expected](char c) {
        return text::Tokenizer::classify(static_cast<unsigned char>(c)) == expected;
    });
}

std::vector<std::pair<std::string, uint64_t>> sorted_entries(const CountMap& counts) {
    std::vector<std::pair<std::string, uint64_t>> entries(counts.begin(), counts.end());
    std::sort(entries.begin(), entries.end());
    return entries;
}

/**
 * Output stream wrapper that hashes everything it writes.
 */
class SnapshotWriter {
public:
    explicit SnapshotWriter(std::ostream& out) : out_(out) {
        XXH3_64bits_reset(&state_);
    }

    void raw(const void* data, size_t size) {
        XXH3_64bits_update(&state_, data, size);
        out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    }

    template <typename T>
    void value(T v) { raw(&v, sizeof(v)); }

    void tag(const char (&t)[4]) { raw(t, 4); }

    void string(const std::string& s, const char* what) {
        if (s.empty() || s.size() > MAX_ENTRY_BYTES) {
            throw InvalidInputError(std::string("Cannot store ") + what + " of " +
                                    std::to_string(s.size()) + " bytes");
        }
        value(static_cast<uint32_t>(s.size()));
        raw(s.data(), s.size());
    }

    void counts(const CountMap& counts, const char* what) {
        value(static_cast<uint64_t>(counts.size()));
        for (const auto& [key, count] : sorted_entries(counts)) {
            string(key, what);
            value(count);
        }
    }

    void finish() {
        tag(TAG_END);
        uint64_t checksum = XXH3_64bits_digest(&state_);
        out_.write(reinterpret_cast<const char*>(&checksum), sizeof(checksum));
    }

private:
    std::ostream& out_;
    XXH3_state_t state_;
};

/**
 * Input stream wrapper that hashes everything it reads and turns
 * truncation into SnapshotCorruptError.
 */
class SnapshotReader {
public:
    explicit SnapshotReader(std::istream& in) : in_(in) {
        XXH3_64bits_reset(&state_);
    }

    void raw(void* data, size_t size, const char* what) {
        in_.read(static_cast<char*>(data), static_cast<std::streamsize>(size));
        if (static_cast<size_t>(in_.gcount()) != size) {
            throw SnapshotCorruptError(std::string("Snapshot truncated while reading ") + what);
        }
        XXH3_64bits_update(&state_, data, size);
    }

    template <typename T>
    T value(const char* what) {
        T v;
        raw(&v, sizeof(v), what);
        return v;
    }

    void expect_tag(const char (&t)[4]) {
        char buf[4];
        raw(buf, 4, "section tag");
        if (std::memcmp(buf, t, 4) != 0) {
            throw SnapshotCorruptError("Expected snapshot section '" + std::string(t, 4) +
                                       "', found '" + std::string(buf, 4) + "'");
        }
    }

    std::string string(const char* what) {
        auto size = value<uint32_t>(what);
        if (size == 0 || size > MAX_ENTRY_BYTES) {
            throw SnapshotCorruptError(std::string("Invalid string length in ") + what);
        }
        std::string s(size, '\0');
        raw(s.data(), size, what);
        return s;
    }

    uint64_t digest() const { return XXH3_64bits_digest(&state_); }

    /**
     * Read the stored checksum without hashing it.
     */
    uint64_t checksum() {
        uint64_t stored = 0;
        in_.read(reinterpret_cast<char*>(&stored), sizeof(stored));
        if (static_cast<size_t>(in_.gcount()) != sizeof(stored)) {
            throw SnapshotCorruptError("Snapshot truncated while reading checksum");
        }
        return stored;
    }

    bool at_end() {
        return in_.peek() == std::char_traits<char>::eof();
    }

private:
    std::istream& in_;
    XXH3_state_t state_;
};

}  // namespace

void save_snapshot(const PCFGModel& model, std::ostream& out) {
    SnapshotWriter writer(out);

    writer.raw(MAGIC, 4);
    writer.value(PCFGModel::SCHEMA_VERSION);

    writer.tag(TAG_HEADER);
    writer.value(model.alpha());
    writer.value(model.total_examples());
    writer.value(static_cast<uint8_t>(model.settings().leet ? 1 : 0));
    writer.value(model.settings().min_word_length);
    writer.value(model.settings().vocabulary_fingerprint);

    writer.tag(TAG_TEMPLATES);
    writer.counts(model.table().templates(), "template label");

    writer.tag(TAG_TOKENS);
    writer.value(static_cast<uint8_t>(NUM_TOKEN_TYPES));
    for (TokenType type : ALL_TOKEN_TYPES) {
        writer.value(static_cast<uint8_t>(type));
        writer.counts(model.table().tokens(type), "token value");
    }

    writer.finish();
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing model snapshot");
    }
}

void save_snapshot(const PCFGModel& model, const std::string& path) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot create snapshot file: " + tmp_path);
        }
        try {
            save_snapshot(model, file);
        } catch (const std::runtime_error&) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            throw;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Cannot move snapshot into place: " + path);
    }

    Logger::instance().log_snapshot("SAVE", path, model.total_examples());
}

PCFGModel load_snapshot(std::istream& in) {
    SnapshotReader reader(in);

    char magic[4];
    reader.raw(magic, 4, "magic");
    if (std::memcmp(magic, MAGIC, 4) != 0) {
        throw SnapshotCorruptError("Not a passgram model snapshot (bad magic)");
    }

    auto version = reader.value<uint32_t>("schema version");
    if (version != PCFGModel::SCHEMA_VERSION) {
        throw SnapshotCorruptError("Unsupported snapshot schema version " + std::to_string(version) +
                                   " (expected " + std::to_string(PCFGModel::SCHEMA_VERSION) + ")");
    }

    reader.expect_tag(TAG_HEADER);
    auto alpha = reader.value<double>("alpha");
    auto total_examples = reader.value<uint64_t>("total examples");
    auto leet = reader.value<uint8_t>("leet flag");
    TokenizerSettings settings;
    settings.min_word_length = reader.value<uint32_t>("min word length");
    settings.vocabulary_fingerprint = reader.value<uint64_t>("vocabulary fingerprint");

    if (!std::isfinite(alpha) || alpha <= 0.0) {
        throw SnapshotCorruptError("Snapshot alpha is not a positive finite number");
    }
    if (leet > 1) {
        throw SnapshotCorruptError("Snapshot leet flag is not boolean");
    }
    settings.leet = leet == 1;
    if (settings.min_word_length == 0) {
        throw SnapshotCorruptError("Snapshot min word length is zero");
    }

    FrequencyTable table;
    std::set<std::pair<TokenType, size_t>> slots;

    reader.expect_tag(TAG_TEMPLATES);
    auto num_templates = reader.value<uint64_t>("template count");
    for (uint64_t i = 0; i < num_templates; ++i) {
        std::string label = reader.string("template label");
        auto count = reader.value<uint64_t>("template frequency");
        if (count == 0) {
            throw SnapshotCorruptError("Template with zero count: " + label);
        }
        if (table.template_count(label) != 0) {
            throw SnapshotCorruptError("Duplicate template: " + label);
        }
        try {
            for (const Slot& slot : Template::parse(label).slots) {
                slots.emplace(slot.type, slot.length);
            }
        } catch (const InvalidInputError& e) {
            throw SnapshotCorruptError(std::string("Invalid template in snapshot: ") + e.what());
        }
        table.add_template(label, count);
    }

    reader.expect_tag(TAG_TOKENS);
    auto num_types = reader.value<uint8_t>("token type count");
    if (num_types > NUM_TOKEN_TYPES) {
        throw SnapshotCorruptError("Too many token type sections");
    }
    bool seen[NUM_TOKEN_TYPES] = {};
    for (uint8_t t = 0; t < num_types; ++t) {
        auto type_id = reader.value<uint8_t>("token type");
        if (type_id >= NUM_TOKEN_TYPES || seen[type_id]) {
            throw SnapshotCorruptError("Unknown or repeated token type id " + std::to_string(type_id));
        }
        seen[type_id] = true;
        auto type = static_cast<TokenType>(type_id);

        auto num_values = reader.value<uint64_t>("token value count");
        for (uint64_t i = 0; i < num_values; ++i) {
            std::string value = reader.string("token value");
            auto count = reader.value<uint64_t>("token frequency");
            if (count == 0) {
                throw SnapshotCorruptError("Token value with zero count");
            }
            for (unsigned char c : value) {
                if (c < 0x20 || c == 0x7F) {
                    throw SnapshotCorruptError("Control byte in token value");
                }
            }
            if (!matches_class(type, value)) {
                throw SnapshotCorruptError(std::string("Token value does not match its type ") +
                                           token_type_name(type));
            }
            // Templates are never trimmed, so every stored value fills some slot
            if (slots.count({type, value.size()}) == 0) {
                throw SnapshotCorruptError(std::string("Token value fits no template slot: ") +
                                           token_type_name(type) + std::to_string(value.size()));
            }
            // Short letter runs are always FRAG; without a vocabulary long ones are always WORD
            bool long_run = value.size() >= settings.min_word_length;
            if ((type == TokenType::WORD && !long_run) ||
                (type == TokenType::FRAG && long_run && settings.vocabulary_fingerprint == 0)) {
                throw SnapshotCorruptError("Letter run stored under the wrong type for its length");
            }
            if (table.token_count(type, value) != 0) {
                throw SnapshotCorruptError("Duplicate token value under " + std::string(token_type_name(type)));
            }
            table.add_token(type, value, count);
        }
    }

    reader.expect_tag(TAG_END);
    uint64_t computed = reader.digest();
    if (reader.checksum() != computed) {
        throw SnapshotCorruptError("Snapshot checksum mismatch");
    }
    if (!reader.at_end()) {
        throw SnapshotCorruptError("Trailing bytes after snapshot");
    }

    if (table.template_total() != total_examples) {
        throw SnapshotCorruptError("Template counts do not add up to total examples");
    }

    try {
        return PCFGModel(alpha, std::move(table), settings);
    } catch (const InvalidInputError& e) {
        throw SnapshotCorruptError(std::string("Invalid template in snapshot: ") + e.what());
    }
}

PCFGModel load_snapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open snapshot file: " + path);
    }
    PCFGModel model = load_snapshot(file);
    Logger::instance().log_snapshot("LOAD", path, model.total_examples());
    return model;
}

}  // namespace pcfg
}  // namespace passgram
