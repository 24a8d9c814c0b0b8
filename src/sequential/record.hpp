#ifndef RECORD_HPP
#define RECORD_HPP
#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// Records are opaque lines. std::string compares through char_traits<char>,
// which orders bytes as unsigned char, so "<" is byte-lexicographic.

constexpr size_t MERGE_PROGRESS_INTERVAL = 1000000;
constexpr size_t CANCEL_CHECK_INTERVAL = 1 << 16;
constexpr size_t DEFAULT_MERGE_FAN_IN = 128;
constexpr const char* TRIM_CHARS = " \t\r\n\v\f";

struct SortConfig {
    size_t memory_budget_bytes = 0;
    std::string temp_dir;
    bool deduplicate = true;
    bool auto_verify = true;
    bool clean_input = true;           // false: input is already trimmed with no empty lines
    std::string blacklist_chars;       // lines containing any of these are dropped while cleaning
    int num_threads = 1;               // > 1 selects the OpenMP spill backend
    bool strict_merge = false;         // unreadable chunk aborts the merge instead of being skipped
    size_t merge_fan_in = DEFAULT_MERGE_FAN_IN; // most chunks opened by one merge
    bool reuse_existing_output = true; // keep an existing output that already verifies
    bool check_disk_space = true;
    bool verbose = false;
};

struct CleanStats {
    size_t lines_in = 0;
    size_t lines_out = 0;
};

// A sealed spill segment on disk.
struct ChunkFile {
    std::string path;
    size_t lines = 0;
    size_t bytes = 0;   // buffered line content, newlines excluded
};

struct MergeStats {
    size_t lines_read = 0;
    size_t lines_written = 0;
    std::vector<std::string> failed_chunks;
};

struct VerificationReport {
    bool is_sorted = true;
    size_t lines_checked = 0;
    std::optional<size_t> first_violation_line;   // 1-based
};

using SpillFunction = std::function<std::vector<ChunkFile>(
    const std::string& input_file, const SortConfig& cfg, const std::string& job_id,
    const std::atomic<bool>* cancel)>;

void validateConfig(const SortConfig& cfg);
std::string makeJobId();
std::string chunkPath(const std::string& temp_dir, const std::string& job_id, size_t seq);
void removeChunks(const std::vector<ChunkFile>& chunks);

CleanStats cleanFile(const std::string& input_file, const std::string& output_file,
                     const std::string& blacklist_chars = "", bool append = false);

size_t readChunk(std::istream& in, std::vector<std::string>& lines, size_t max_bytes, std::string& carry);
void sortAndWriteChunk(std::vector<std::string>& lines, const std::string& temp_file);
std::vector<ChunkFile> createSortedChunks(const std::string& input_file, const SortConfig& cfg,
                                          const std::string& job_id,
                                          const std::atomic<bool>* cancel = nullptr);
std::vector<ChunkFile> createSortedChunksOMP(const std::string& input_file, const SortConfig& cfg,
                                             const std::string& job_id,
                                             const std::atomic<bool>* cancel = nullptr);

MergeStats mergeChunks(const std::vector<std::string>& temp_files, const std::string& output_file,
                       bool deduplicate, const SortConfig& cfg,
                       const std::atomic<bool>* cancel = nullptr);
size_t mergeFanIn(const SortConfig& cfg);
std::vector<ChunkFile> mergePass(const std::vector<ChunkFile>& chunks, const SortConfig& cfg,
                                 const std::string& job_id, size_t fan_in, bool deduplicate,
                                 MergeStats& stats, const std::atomic<bool>* cancel = nullptr);
MergeStats mergeChunksLinear(const std::vector<std::string>& temp_files, const std::string& output_file,
                             bool deduplicate, const SortConfig& cfg,
                             const std::atomic<bool>* cancel = nullptr);

VerificationReport validateOutput(const std::string& output_file,
                                  size_t max_lines = std::numeric_limits<size_t>::max());

void generateInputFile(const std::string& filename, size_t num_lines, size_t max_line_len, uint64_t seed);
#endif
