#include "record.hpp"
#include "sort_error.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <queue>
#include <sys/resource.h>

namespace {

struct ChunkCursor {
    std::string path;
    std::ifstream in;
    std::string current;
    bool exhausted = false;
    bool failed = false;
};

// Loads the next record into `current`, or marks the cursor exhausted.
bool advance(ChunkCursor& cursor) {
    while (std::getline(cursor.in, cursor.current)) {
        if (!cursor.current.empty() && cursor.current.back() == '\r') cursor.current.pop_back();
        if (!cursor.current.empty()) return true;
    }
    cursor.exhausted = true;
    cursor.failed = cursor.in.bad() || !cursor.in.eof();
    return false;
}

class MergeOutput {
public:
    MergeOutput(const std::string& output_file, bool deduplicate, const SortConfig& cfg,
                const std::atomic<bool>* cancel, MergeStats& stats)
        : path_(output_file), out_(output_file, std::ios::binary | std::ios::trunc),
          deduplicate_(deduplicate), strict_(cfg.strict_merge), verbose_(cfg.verbose),
          cancel_(cancel), stats_(stats) {
        if (!out_) {
            throw IOFailure(SortStage::Merging, output_file, "cannot open merge output");
        }
    }

    void emit(const std::string& line) {
        ++stats_.lines_read;
        if (cancel_ && stats_.lines_read % CANCEL_CHECK_INTERVAL == 0 && cancel_->load()) {
            throw SortCancelled(SortStage::Merging);
        }
        if (deduplicate_ && has_last_ && line == last_) return;
        out_.write(line.data(), line.size());
        out_.put('\n');
        last_ = line;
        has_last_ = true;
        ++stats_.lines_written;
        if (verbose_ && stats_.lines_written % MERGE_PROGRESS_INTERVAL == 0) {
            std::cout << "  Merged " << stats_.lines_written << " lines...\n";
        }
    }

    // A chunk that cannot be read any further is dropped from the merge
    // unless strict_merge asks for the whole merge to fail.
    void chunkFailed(const ChunkCursor& cursor) {
        if (strict_) {
            throw IOFailure(SortStage::Merging, cursor.path, "chunk unreadable");
        }
        std::cerr << "Warning: merging: chunk " << cursor.path
                  << " unreadable, remaining lines of this chunk are lost\n";
        stats_.failed_chunks.push_back(cursor.path);
    }

    void finish() {
        out_.close();
        if (out_.fail()) {
            throw IOFailure(SortStage::Merging, path_, "write error");
        }
        if (verbose_) {
            std::cout << "Merge complete. Total lines written: " << stats_.lines_written << "\n";
        }
    }

private:
    std::string path_;
    std::ofstream out_;
    bool deduplicate_;
    bool strict_;
    bool verbose_;
    const std::atomic<bool>* cancel_;
    MergeStats& stats_;
    std::string last_;
    bool has_last_ = false;
};

std::vector<ChunkCursor> openCursors(const std::vector<std::string>& temp_files, MergeOutput& output) {
    std::vector<ChunkCursor> cursors(temp_files.size());
    for (size_t i = 0; i < temp_files.size(); ++i) {
        ChunkCursor& cursor = cursors[i];
        cursor.path = temp_files[i];
        cursor.in.open(cursor.path, std::ios::binary);
        if (!cursor.in) {
            cursor.exhausted = true;
            cursor.failed = true;
            output.chunkFailed(cursor);
        } else if (!advance(cursor) && cursor.failed) {
            output.chunkFailed(cursor);
        }
    }
    return cursors;
}

struct MergeLine {
    const std::string* line;
    size_t cursor_idx;
    bool operator>(const MergeLine& other) const { return *line > *other.line; }
};

} // anonymous namespace

MergeStats mergeChunks(const std::vector<std::string>& temp_files, const std::string& output_file,
                       bool deduplicate, const SortConfig& cfg, const std::atomic<bool>* cancel) {
    MergeStats stats;
    MergeOutput output(output_file, deduplicate, cfg, cancel, stats);
    std::vector<ChunkCursor> cursors = openCursors(temp_files, output);

    std::priority_queue<MergeLine, std::vector<MergeLine>, std::greater<MergeLine>> heap;
    for (size_t i = 0; i < cursors.size(); ++i) {
        if (!cursors[i].exhausted) {
            heap.push({&cursors[i].current, i});
        }
    }
    while (!heap.empty()) {
        MergeLine smallest = heap.top();
        heap.pop();
        ChunkCursor& cursor = cursors[smallest.cursor_idx];
        output.emit(cursor.current);
        if (advance(cursor)) {
            heap.push(smallest);
        } else if (cursor.failed) {
            output.chunkFailed(cursor);
        }
    }
    output.finish();
    return stats;
}

// Keeps the fan-in below the soft open-file limit, leaving room for the
// output stream and whatever else the process holds open.
size_t mergeFanIn(const SortConfig& cfg) {
    constexpr rlim_t reserved_fds = 16;
    struct rlimit limit;
    if (getrlimit(RLIMIT_NOFILE, &limit) != 0 || limit.rlim_cur == RLIM_INFINITY) {
        return cfg.merge_fan_in;
    }
    size_t usable = limit.rlim_cur > reserved_fds + 2 ? static_cast<size_t>(limit.rlim_cur - reserved_fds) : 2;
    return std::min(cfg.merge_fan_in, usable);
}

// Merges each group of up to fan_in chunks into one intermediate run named
// after job_id. Merged chunks are removed group by group. On error the runs
// written so far are removed and the remaining input chunks stay with the caller.
std::vector<ChunkFile> mergePass(const std::vector<ChunkFile>& chunks, const SortConfig& cfg,
                                 const std::string& job_id, size_t fan_in, bool deduplicate,
                                 MergeStats& stats, const std::atomic<bool>* cancel) {
    std::vector<ChunkFile> runs;
    std::vector<ChunkFile> written;
    try {
        for (size_t begin = 0; begin < chunks.size(); begin += fan_in) {
            size_t end = std::min(chunks.size(), begin + fan_in);
            std::vector<ChunkFile> group(chunks.begin() + begin, chunks.begin() + end);
            if (group.size() == 1) {
                runs.push_back(group.front());
                continue;
            }
            std::vector<std::string> temp_files;
            size_t bytes = 0;
            for (const auto& chunk : group) {
                temp_files.push_back(chunk.path);
                bytes += chunk.bytes;
            }
            written.push_back({chunkPath(cfg.temp_dir, job_id, runs.size()), 0, bytes});
            MergeStats group_stats = mergeChunks(temp_files, written.back().path, deduplicate, cfg, cancel);
            written.back().lines = group_stats.lines_written;
            runs.push_back(written.back());
            stats.lines_read += group_stats.lines_read;
            stats.failed_chunks.insert(stats.failed_chunks.end(), group_stats.failed_chunks.begin(),
                                       group_stats.failed_chunks.end());
            removeChunks(group);
        }
    } catch (...) {
        removeChunks(written);
        throw;
    }
    if (cfg.verbose) {
        std::cout << "  Merge pass reduced " << chunks.size() << " chunks to " << runs.size() << "\n";
    }
    return runs;
}

MergeStats mergeChunksLinear(const std::vector<std::string>& temp_files, const std::string& output_file,
                             bool deduplicate, const SortConfig& cfg, const std::atomic<bool>* cancel) {
    MergeStats stats;
    MergeOutput output(output_file, deduplicate, cfg, cancel, stats);
    std::vector<ChunkCursor> cursors = openCursors(temp_files, output);

    while (true) {
        ChunkCursor* smallest = nullptr;
        for (auto& cursor : cursors) {
            if (!cursor.exhausted && (smallest == nullptr || cursor.current < smallest->current)) {
                smallest = &cursor;
            }
        }
        if (smallest == nullptr) break;
        output.emit(smallest->current);
        if (!advance(*smallest) && smallest->failed) {
            output.chunkFailed(*smallest);
        }
    }
    output.finish();
    return stats;
}
