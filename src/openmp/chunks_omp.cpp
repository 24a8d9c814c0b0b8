#include "../sequential/record.hpp"
#include "../sequential/sort_error.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <omp.h>

// OpenMP version of createSortedChunks. Reads up to num_threads batches,
// each limited to memory_budget_bytes / num_threads, then sorts and writes
// them in parallel. All batches of one round share the budget.
std::vector<ChunkFile> createSortedChunksOMP(const std::string& input_file, const SortConfig& cfg,
                                             const std::string& job_id, const std::atomic<bool>* cancel) {
    std::ifstream in(input_file, std::ios::binary);
    if (!in) {
        throw InputNotFound(SortStage::Spilling, input_file);
    }

    const int num_threads = std::max(1, cfg.num_threads);
    const size_t batch_budget = std::max<size_t>(1, cfg.memory_budget_bytes / num_threads);

    std::vector<ChunkFile> chunks;
    std::vector<std::vector<std::string>> batches(num_threads);
    std::vector<std::exception_ptr> errors(num_threads);
    std::string carry;
    try {
        while (true) {
            if (cancel && cancel->load()) {
                throw SortCancelled(SortStage::Spilling);
            }
            int filled = 0;
            while (filled < num_threads) {
                size_t bytes_read = readChunk(in, batches[filled], batch_budget, carry);
                if (batches[filled].empty()) break;
                chunks.push_back({chunkPath(cfg.temp_dir, job_id, chunks.size()), batches[filled].size(), bytes_read});
                ++filled;
            }
            if (in.bad()) {
                throw IOFailure(SortStage::Spilling, input_file, "read error");
            }
            if (filled == 0) break;

            const size_t first = chunks.size() - filled;
            // Exceptions must not leave the parallel region; collect them instead.
            #pragma omp parallel for num_threads(num_threads) schedule(dynamic)
            for (int i = 0; i < filled; ++i) {
                errors[i] = nullptr;
                try {
                    sortAndWriteChunk(batches[i], chunks[first + i].path);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
                batches[i].clear();
            }
            for (int i = 0; i < filled; ++i) {
                if (errors[i]) {
                    std::rethrow_exception(errors[i]);
                }
            }
            if (cfg.verbose) {
                std::cout << "  Sorted " << filled << " chunks on " << num_threads
                          << " threads (" << chunks.size() << " total)\n";
            }
            if (filled < num_threads) break;
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
