#include "record.hpp"
#include "sort_error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

void validateConfig(const SortConfig& cfg) {
    if (cfg.memory_budget_bytes == 0) {
        throw ConfigError("memory_budget_bytes must be a positive number of bytes");
    }
    if (cfg.temp_dir.empty()) {
        throw ConfigError("temp_dir is required");
    }
    if (cfg.num_threads < 1) {
        throw ConfigError("num_threads must be at least 1, got " + std::to_string(cfg.num_threads));
    }
    if (cfg.merge_fan_in < 2) {
        throw ConfigError("merge_fan_in must be at least 2, got " + std::to_string(cfg.merge_fan_in));
    }
    std::error_code ec;
    fs::create_directories(cfg.temp_dir, ec);
    if (!fs::is_directory(cfg.temp_dir)) {
        throw ConfigError("temp_dir is not a directory: " + cfg.temp_dir);
    }
    if (access(cfg.temp_dir.c_str(), W_OK | X_OK) != 0) {
        throw ConfigError("temp_dir is not writable: " + cfg.temp_dir);
    }
}

std::string makeJobId() {
    static std::atomic<size_t> job_counter{0};
    return std::to_string(getpid()) + "_" + std::to_string(job_counter.fetch_add(1));
}

std::string chunkPath(const std::string& temp_dir, const std::string& job_id, size_t seq) {
    std::string num = std::to_string(seq);
    if (num.size() < 6) {
        num.insert(0, 6 - num.size(), '0');
    }
    return (fs::path(temp_dir) / ("chunk_" + job_id + "_" + num + ".txt")).string();
}

void removeChunks(const std::vector<ChunkFile>& chunks) {
    for (const auto& chunk : chunks) {
        std::error_code ec;
        fs::remove(chunk.path, ec);
        if (ec) {
            std::cerr << "Warning: could not remove chunk " << chunk.path << ": " << ec.message() << "\n";
        }
    }
}

CleanStats cleanFile(const std::string& input_file, const std::string& output_file,
                     const std::string& blacklist_chars, bool append) {
    std::ifstream in(input_file, std::ios::binary);
    if (!in) {
        throw InputNotFound(SortStage::Cleaning, input_file);
    }
    std::ofstream out(output_file, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!out) {
        throw IOFailure(SortStage::Cleaning, output_file, "cannot open cleaned output");
    }

    CleanStats stats;
    std::string line;
    while (std::getline(in, line)) {
        ++stats.lines_in;
        size_t first = line.find_first_not_of(TRIM_CHARS);
        if (first == std::string::npos) continue;
        size_t last = line.find_last_not_of(TRIM_CHARS);
        std::string_view trimmed(line.data() + first, last - first + 1);
        if (!blacklist_chars.empty() && trimmed.find_first_of(blacklist_chars) != std::string_view::npos) {
            continue;
        }
        out.write(trimmed.data(), trimmed.size());
        out.put('\n');
        ++stats.lines_out;
    }
    if (in.bad()) {
        throw IOFailure(SortStage::Cleaning, input_file, "read error");
    }
    out.flush();
    if (!out) {
        throw IOFailure(SortStage::Cleaning, output_file, "write error");
    }
    return stats;
}

// Fills `lines` until adding the next line would push the content past
// max_bytes. The line that did not fit is left in `carry` for the next call.
// A single line larger than max_bytes still forms a batch of its own.
size_t readChunk(std::istream& in, std::vector<std::string>& lines, size_t max_bytes, std::string& carry) {
    lines.clear();
    size_t total_bytes = 0;
    if (!carry.empty()) {
        total_bytes = carry.size();
        lines.push_back(std::move(carry));
        carry.clear();
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!lines.empty() && total_bytes + line.size() > max_bytes) {
            carry = std::move(line);
            break;
        }
        total_bytes += line.size();
        lines.push_back(std::move(line));
    }
    return total_bytes;
}

void sortAndWriteChunk(std::vector<std::string>& lines, const std::string& temp_file) {
    std::sort(lines.begin(), lines.end());
    std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOFailure(SortStage::Spilling, temp_file, "cannot create chunk");
    }
    for (const auto& line : lines) {
        out.write(line.data(), line.size());
        out.put('\n');
    }
    out.close();
    if (out.fail()) {
        throw IOFailure(SortStage::Spilling, temp_file, "cannot write chunk");
    }
}

std::vector<ChunkFile> createSortedChunks(const std::string& input_file, const SortConfig& cfg,
                                          const std::string& job_id, const std::atomic<bool>* cancel) {
    std::ifstream in(input_file, std::ios::binary);
    if (!in) {
        throw InputNotFound(SortStage::Spilling, input_file);
    }
    std::vector<ChunkFile> chunks;
    std::vector<std::string> lines;
    std::string carry;
    try {
        while (true) {
            if (cancel && cancel->load()) {
                throw SortCancelled(SortStage::Spilling);
            }
            size_t bytes_read = readChunk(in, lines, cfg.memory_budget_bytes, carry);
            if (lines.empty()) break;
            std::string temp_file = chunkPath(cfg.temp_dir, job_id, chunks.size());
            chunks.push_back({temp_file, lines.size(), bytes_read});
            sortAndWriteChunk(lines, temp_file);
            if (cfg.verbose) {
                std::cout << "  Created chunk " << chunks.size() << " with " << lines.size() << " lines\n";
            }
        }
        if (in.bad()) {
            throw IOFailure(SortStage::Spilling, input_file, "read error");
        }
    } catch (...) {
        removeChunks(chunks);
        throw;
    }
    if (cfg.verbose) {
        std::cout << "Created " << chunks.size() << " chunks\n";
    }
    return chunks;
}

VerificationReport validateOutput(const std::string& output_file, size_t max_lines) {
    std::ifstream in(output_file, std::ios::binary);
    if (!in) {
        throw InputNotFound(SortStage::Verifying, output_file);
    }
    VerificationReport report;
    std::string prev, line;
    while (report.lines_checked < max_lines && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++report.lines_checked;
        if (report.lines_checked > 1 && line < prev) {
            report.is_sorted = false;
            report.first_violation_line = report.lines_checked;
            return report;
        }
        prev.swap(line);
    }
    if (in.bad()) {
        throw IOFailure(SortStage::Verifying, output_file, "read error");
    }
    return report;
}

// Pseudo-random text with repeated values, padding whitespace, blank lines
// and CRLF terminators mixed in.
void generateInputFile(const std::string& filename, size_t num_lines, size_t max_line_len, uint64_t seed) {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOFailure(SortStage::Cleaning, filename, "cannot create input file");
    }
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> len_dist(1, std::max<size_t>(1, max_line_len));
    std::uniform_int_distribution<int> char_dist('a', 'f');
    std::uniform_int_distribution<int> shape_dist(0, 19);
    std::string line;
    for (size_t i = 0; i < num_lines; ++i) {
        int shape = shape_dist(rng);
        if (shape == 0) {
            out << "   \n";
            continue;
        }
        line.assign(len_dist(rng), ' ');
        for (auto& c : line) c = static_cast<char>(char_dist(rng));
        if (shape == 1) line = "  " + line;
        if (shape == 2) line += "\t ";
        out << line << (shape == 3 ? "\r\n" : "\n");
    }
    out.close();
    if (out.fail()) {
        throw IOFailure(SortStage::Cleaning, filename, "cannot write input file");
    }
}
