#include "session.hpp"
#include "sort_error.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

SortSession::SortSession(SortConfig cfg, SpillFunction spill)
    : cfg_(std::move(cfg)), spill_(std::move(spill)) {
    validateConfig(cfg_);
    space_query_ = [](const std::string& dir, std::error_code& ec) { return fs::space(dir, ec); };
    if (!spill_) {
        if (cfg_.num_threads > 1) {
            spill_ = createSortedChunksOMP;
        } else {
            spill_ = createSortedChunks;
        }
    }
}

SortSummary SortSession::run(const std::string& input_file, const std::string& output_file) {
    return run(std::vector<std::string>{input_file}, output_file);
}

SortSummary SortSession::run(const std::vector<std::string>& input_files, const std::string& output_file) {
    try {
        SortSummary summary = runJob(input_files, output_file);
        cancelled_.store(false);
        return summary;
    } catch (...) {
        cancelled_.store(false);
        throw;
    }
}

SortSummary SortSession::runJob(const std::vector<std::string>& input_files, const std::string& output_file) {
    auto start = std::chrono::steady_clock::now();
    checkInputs(input_files, output_file);
    job_id_ = makeJobId();
    merge_passes_ = 0;

    SortSummary summary;
    if (cfg_.reuse_existing_output && fs::exists(output_file)) {
        VerificationReport existing = validateOutput(output_file);
        if (existing.is_sorted) {
            if (cfg_.verbose) {
                std::cout << "Output " << output_file << " already sorted (" << existing.lines_checked
                          << " lines), skipping\n";
            }
            summary.lines_out = existing.lines_checked;
            summary.reused_existing = true;
            return summary;
        }
        std::cerr << "Warning: existing output " << output_file << " is unsorted at line "
                  << *existing.first_violation_line << ", rebuilding it\n";
    }

    checkDiskSpace(input_files);

    try {
        std::vector<std::string> spill_inputs = input_files;
        if (cfg_.clean_input) {
            checkCancelled(SortStage::Cleaning);
            if (cfg_.verbose) std::cout << "Step 1/3: Cleaning input...\n";
            cleaned_file_ = (fs::path(cfg_.temp_dir) / ("cleaned_" + job_id_ + ".txt")).string();
            for (size_t i = 0; i < input_files.size(); ++i) {
                CleanStats cleaned = cleanFile(input_files[i], cleaned_file_, cfg_.blacklist_chars, i > 0);
                summary.lines_in += cleaned.lines_in;
            }
            spill_inputs = {cleaned_file_};
        }

        if (cfg_.verbose) std::cout << "Step 2/3: Sorting chunks...\n";
        summary.lines_cleaned = spill(spill_inputs, 0);
        if (!cfg_.clean_input) {
            summary.lines_in = summary.lines_cleaned;
        }
        summary.chunks = chunks_.size();
        removeCleanedFile();

        if (cfg_.verbose) std::cout << "Step 3/3: Merging " << summary.chunks << " chunks...\n";
        MergeStats merged = mergeInto(output_file, cfg_.deduplicate);
        summary.lines_out = merged.lines_written;
        summary.failed_chunks = merged.failed_chunks;

        if (cfg_.auto_verify) {
            checkCancelled(SortStage::Verifying);
            VerificationReport report = validateOutput(output_file);
            if (!report.is_sorted) {
                std::cerr << "Warning: verifying: " << output_file << " unsorted at line "
                          << *report.first_violation_line << ", resorting\n";
                summary.resorted = true;
                // Disorder can hide duplicates from the first merge, so dedup runs again.
                spill({output_file}, 1);
                summary.chunks = chunks_.size();
                merged = mergeInto(output_file, cfg_.deduplicate);
                summary.lines_out = merged.lines_written;
                summary.failed_chunks.insert(summary.failed_chunks.end(),
                                             merged.failed_chunks.begin(), merged.failed_chunks.end());
                report = validateOutput(output_file);
                if (!report.is_sorted) {
                    throw VerificationFailed(output_file, *report.first_violation_line);
                }
            }
            if (cfg_.verbose) std::cout << "Validated " << report.lines_checked << " lines\n";
        }
    } catch (...) {
        discardScratch();
        throw;
    }

    summary.merge_passes = merge_passes_;
    summary.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return summary;
}

void SortSession::checkInputs(const std::vector<std::string>& input_files, const std::string& output_file) const {
    if (input_files.empty()) {
        throw ConfigError("no input files given");
    }
    if (output_file.empty()) {
        throw ConfigError("no output file given");
    }
    for (const auto& input : input_files) {
        if (!fs::is_regular_file(input)) {
            throw InputNotFound(SortStage::Preflight, input);
        }
        std::error_code ec;
        if (fs::exists(output_file) && fs::equivalent(input, output_file, ec)) {
            throw ConfigError("output file must differ from input file: " + input);
        }
    }
}

// Spilling and merging need about twice the input size in temp_dir.
void SortSession::checkDiskSpace(const std::vector<std::string>& input_files) {
    if (!cfg_.check_disk_space) return;
    uintmax_t input_bytes = 0;
    for (const auto& input : input_files) {
        input_bytes += fs::file_size(input);
    }
    uintmax_t required = input_bytes * 2;

    std::error_code ec;
    fs::space_info space = space_query_(cfg_.temp_dir, ec);
    if (ec) {
        std::cerr << "Note: cannot query free space in " << cfg_.temp_dir << " (" << ec.message()
                  << "), make sure at least " << required << " bytes are free\n";
        return;
    }
    if (space.available >= required) return;

    std::cerr << "Warning: low disk space in " << cfg_.temp_dir << ": required ~" << required
              << " bytes, available " << space.available << " bytes\n";
    if (confirm_ && confirm_(DiskSpaceShortfall{cfg_.temp_dir, required, space.available})) {
        return;
    }
    throw InsufficientDiskSpace(cfg_.temp_dir, required, space.available);
}

void SortSession::checkCancelled(SortStage stage) const {
    if (cancelled_.load()) {
        throw SortCancelled(stage);
    }
}

// Spills every file into chunks_ and returns the number of lines spilled.
size_t SortSession::spill(const std::vector<std::string>& files, int pass) {
    const SortStage stage = pass == 0 ? SortStage::Spilling : SortStage::ReSorting;
    size_t lines = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        checkCancelled(stage);
        std::string spill_id = job_id_ + "_p" + std::to_string(pass) + "_" + std::to_string(i);
        std::vector<ChunkFile> chunks = spill_(files[i], cfg_, spill_id, &cancelled_);
        for (const auto& chunk : chunks) {
            lines += chunk.lines;
        }
        chunks_.insert(chunks_.end(), chunks.begin(), chunks.end());
    }
    return lines;
}

// Merges chunks_ into "<output>.part" and renames it over the output once
// the merge is complete. Intermediate passes run first while there are more
// chunks than one merge may open. The chunks are removed either way.
MergeStats SortSession::mergeInto(const std::string& output_file, bool deduplicate) {
    checkCancelled(SortStage::Merging);
    MergeStats pass_stats;
    const size_t fan_in = mergeFanIn(cfg_);
    while (chunks_.size() > fan_in) {
        std::string pass_id = job_id_ + "_m" + std::to_string(merge_passes_++);
        chunks_ = mergePass(chunks_, cfg_, pass_id, fan_in, deduplicate, pass_stats, &cancelled_);
        checkCancelled(SortStage::Merging);
    }

    std::vector<std::string> temp_files;
    for (const auto& chunk : chunks_) {
        temp_files.push_back(chunk.path);
    }
    const std::string partial_file = output_file + ".part";
    MergeStats stats = mergeChunks(temp_files, partial_file, deduplicate, cfg_, &cancelled_);
    discardScratch();
    stats.failed_chunks.insert(stats.failed_chunks.begin(), pass_stats.failed_chunks.begin(),
                               pass_stats.failed_chunks.end());

    std::error_code ec;
    fs::rename(partial_file, output_file, ec);
    if (ec) {
        throw IOFailure(SortStage::Merging, output_file, "cannot replace output: " + ec.message());
    }
    return stats;
}

void SortSession::removeCleanedFile() {
    if (cleaned_file_.empty()) return;
    std::error_code ec;
    fs::remove(cleaned_file_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove " << cleaned_file_ << ": " << ec.message() << "\n";
    }
    cleaned_file_.clear();
}

void SortSession::discardScratch() {
    removeChunks(chunks_);
    chunks_.clear();
    removeCleanedFile();
}
