#include "chunks_ff.hpp"
#include "../sequential/sort_error.hpp"
#include <ff/ff.hpp>
#include <ff/farm.hpp>
#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>

namespace {

struct Batch {
    std::vector<std::string> lines;
    ChunkFile chunk;
};

struct ChunkResult {
    ChunkFile chunk;
    std::exception_ptr error;
};

class Emitter : public ff::ff_node {
public:
    Emitter(std::istream& in, const SortConfig& cfg, const std::string& job_id,
            size_t batch_budget, const std::atomic<bool>* cancel)
        : in(in), cfg(cfg), job_id(job_id), batch_budget(batch_budget), cancel(cancel) {}

    void* svc(void*) override {
        if (cancel && cancel->load()) {
            cancelled = true;
            return ff::FF_EOS;
        }
        auto batch = std::make_unique<Batch>();
        size_t bytes_read = readChunk(in, batch->lines, batch_budget, carry);
        if (batch->lines.empty()) {
            read_failed = in.bad();
            return ff::FF_EOS;
        }
        batch->chunk = {chunkPath(cfg.temp_dir, job_id, next_seq++), batch->lines.size(), bytes_read};
        return batch.release();
    }

    bool cancelled = false;
    bool read_failed = false;

private:
    std::istream& in;
    const SortConfig& cfg;
    std::string job_id;
    size_t batch_budget;
    const std::atomic<bool>* cancel;
    std::string carry;
    size_t next_seq = 0;
};

class Worker : public ff::ff_node {
public:
    void* svc(void* task) override {
        std::unique_ptr<Batch> batch(static_cast<Batch*>(task));
        auto result = new ChunkResult{batch->chunk, nullptr};
        try {
            sortAndWriteChunk(batch->lines, batch->chunk.path);
        } catch (...) {
            result->error = std::current_exception();
        }
        return result;
    }
};

class Collector : public ff::ff_node {
public:
    void* svc(void* task) override {
        std::unique_ptr<ChunkResult> result(static_cast<ChunkResult*>(task));
        chunks.push_back(result->chunk);
        if (result->error && !error) {
            error = result->error;
        }
        return ff::FF_GO_ON;
    }

    std::vector<ChunkFile> chunks;
    std::exception_ptr error;
};

} // anonymous namespace

std::vector<ChunkFile> createSortedChunksFF(const std::string& input_file, const SortConfig& cfg,
                                            const std::string& job_id, const std::atomic<bool>* cancel) {
    std::ifstream in(input_file, std::ios::binary);
    if (!in) {
        throw InputNotFound(SortStage::Spilling, input_file);
    }

    const int num_workers = std::max(1, cfg.num_threads);
    const size_t batch_budget = std::max<size_t>(1, cfg.memory_budget_bytes / (2 * num_workers + 1));

    Emitter emitter(in, cfg, job_id, batch_budget, cancel);
    Collector collector;
    std::vector<std::unique_ptr<Worker>> worker_nodes;
    std::vector<ff::ff_node*> workers;
    for (int i = 0; i < num_workers; ++i) {
        worker_nodes.push_back(std::make_unique<Worker>());
        workers.push_back(worker_nodes.back().get());
    }

    ff::ff_farm farm;
    farm.add_emitter(&emitter);
    farm.add_collector(&collector);
    farm.add_workers(workers);
    farm.set_scheduling_ondemand();

    if (cfg.verbose) {
        std::cout << "Starting FastFlow farm with " << num_workers << " workers...\n";
    }
    if (farm.run_and_wait_end() < 0) {
        removeChunks(collector.chunks);
        throw IOFailure(SortStage::Spilling, input_file, "FastFlow farm failed");
    }

    if (collector.error) {
        removeChunks(collector.chunks);
        std::rethrow_exception(collector.error);
    }
    if (emitter.cancelled) {
        removeChunks(collector.chunks);
        throw SortCancelled(SortStage::Spilling);
    }
    if (emitter.read_failed) {
        removeChunks(collector.chunks);
        throw IOFailure(SortStage::Spilling, input_file, "read error");
    }

    // Workers finish out of order; keep the chunk list in sequence order.
    std::sort(collector.chunks.begin(), collector.chunks.end(),
              [](const ChunkFile& a, const ChunkFile& b) { return a.path < b.path; });
    if (cfg.verbose) {
        std::cout << "Created " << collector.chunks.size() << " chunks\n";
    }
    return collector.chunks;
}
