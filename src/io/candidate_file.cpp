/**
 * Candidate File Implementation
 */

#include "candidate_file.hpp"
#include "../core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace passgram {

size_t write_candidates(std::ostream& out, const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (candidate.find_first_of("\r\n") != std::string::npos) {
            throw InvalidInputError("Candidate contains a line break");
        }
        out << candidate << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing candidates");
    }
    return candidates.size();
}

size_t write_candidates(const std::string& path, const std::vector<std::string>& candidates) {
    std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create output directory: " + target.parent_path().string());
        }
    }

    std::string tmp_path = path + ".tmp";
    size_t written = 0;
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot create candidate file: " + tmp_path);
        }
        try {
            written = write_candidates(file, candidates);
        } catch (const std::runtime_error&) {
            file.close();
            std::filesystem::remove(tmp_path, ec);
            throw;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Cannot move candidate file into place: " + path);
    }
    return written;
}

std::vector<std::string> read_candidates(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open candidate file: " + path);
    }

    std::vector<std::string> candidates;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) candidates.push_back(std::move(line));
    }
    return candidates;
}

}  // namespace passgram
