#ifndef CHUNKS_FF_HPP
#define CHUNKS_FF_HPP
#include "../sequential/record.hpp"

// FastFlow farm version of createSortedChunks. The emitter reads batches of
// at most memory_budget_bytes / (2 * workers + 1) bytes and the workers sort
// and write one chunk each. On-demand scheduling keeps a single batch queued
// per worker, so the batches in flight stay within the budget.
std::vector<ChunkFile> createSortedChunksFF(const std::string& input_file, const SortConfig& cfg,
                                            const std::string& job_id,
                                            const std::atomic<bool>* cancel = nullptr);
#endif
