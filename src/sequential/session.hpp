#ifndef SESSION_HPP
#define SESSION_HPP
#include "record.hpp"
#include "sort_error.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

struct DiskSpaceShortfall {
    std::string temp_dir;
    uintmax_t required = 0;
    uintmax_t available = 0;
};

// Returns true to proceed despite the shortfall.
using DiskSpaceConfirm = std::function<bool(const DiskSpaceShortfall&)>;

// Free-space lookup for the pre-flight check; sets ec when the query fails.
using SpaceQuery = std::function<std::filesystem::space_info(const std::string& dir, std::error_code& ec)>;

struct SortSummary {
    size_t lines_in = 0;
    size_t lines_cleaned = 0;
    size_t lines_out = 0;
    size_t chunks = 0;
    size_t merge_passes = 0;    // intermediate passes before the final merge
    std::vector<std::string> failed_chunks;
    bool resorted = false;
    bool reused_existing = false;
    double elapsed_seconds = 0.0;

    size_t linesRemoved() const { return lines_in - lines_out; }
    size_t emptyRemoved() const { return lines_in - lines_cleaned; }
    size_t duplicatesRemoved() const { return lines_cleaned - lines_out; }
};

// Runs clean -> spill -> merge -> verify (-> one resort) for one job at a
// time. The config is validated on construction; a session may be reused for
// several jobs, each getting its own job id for chunk names.
// A cancel() stops the active run, or the next one if none is active. The
// request is consumed when that run returns.
class SortSession {
public:
    explicit SortSession(SortConfig cfg, SpillFunction spill = nullptr);

    SortSession(const SortSession&) = delete;
    SortSession& operator=(const SortSession&) = delete;

    SortSummary run(const std::string& input_file, const std::string& output_file);
    SortSummary run(const std::vector<std::string>& input_files, const std::string& output_file);

    // Safe to call from another thread while run() is active.
    void cancel() { cancelled_.store(true); }

    void setDiskSpaceConfirm(DiskSpaceConfirm confirm) { confirm_ = std::move(confirm); }
    void setSpaceQuery(SpaceQuery query) { space_query_ = std::move(query); }

    const SortConfig& config() const { return cfg_; }
    const std::string& jobId() const { return job_id_; }

private:
    SortSummary runJob(const std::vector<std::string>& input_files, const std::string& output_file);
    void checkInputs(const std::vector<std::string>& input_files, const std::string& output_file) const;
    void checkDiskSpace(const std::vector<std::string>& input_files);
    void checkCancelled(SortStage stage) const;
    size_t spill(const std::vector<std::string>& files, int pass);
    MergeStats mergeInto(const std::string& output_file, bool deduplicate);
    void removeCleanedFile();
    void discardScratch();

    SortConfig cfg_;
    SpillFunction spill_;
    DiskSpaceConfirm confirm_;
    SpaceQuery space_query_;
    std::atomic<bool> cancelled_{false};
    std::string job_id_;
    std::string cleaned_file_;
    std::vector<ChunkFile> chunks_;
    size_t merge_passes_ = 0;
};

#endif
