#include "test_util.hpp"
#include "sequential/session.hpp"
#include "sequential/sort_error.hpp"
#include <algorithm>

class OpenMPTest : public ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        fs::create_directories(tempDir());
        generateInputFile(path("raw.txt"), 2500, 10, 17);
        cleanFile(path("raw.txt"), path("clean.txt"));
    }
};

TEST_F(OpenMPTest, BatchesShareTheBudget) {
    SortConfig cfg = config(120);
    cfg.num_threads = 4;
    std::vector<ChunkFile> chunks = createSortedChunksOMP(path("clean.txt"), cfg, "omp");
    ASSERT_GT(chunks.size(), 4u);

    size_t total = 0;
    for (const auto& chunk : chunks) {
        EXPECT_LE(chunk.bytes, cfg.memory_budget_bytes / 4) << chunk.path;
        EXPECT_TRUE(validateOutput(chunk.path).is_sorted) << chunk.path;
        total += chunk.lines;
    }
    EXPECT_EQ(total, readLines(path("clean.txt")).size());
    removeChunks(chunks);
    EXPECT_EQ(scratchFiles(), 0u);
}

TEST_F(OpenMPTest, MatchesSequentialChunking) {
    SortConfig seq_cfg = config(90);
    SortConfig omp_cfg = config(360);
    omp_cfg.num_threads = 4;
    auto seq_chunks = createSortedChunks(path("clean.txt"), seq_cfg, "seq");
    auto omp_chunks = createSortedChunksOMP(path("clean.txt"), omp_cfg, "omp");
    ASSERT_EQ(seq_chunks.size(), omp_chunks.size());
    for (size_t i = 0; i < seq_chunks.size(); ++i) {
        EXPECT_EQ(readText(seq_chunks[i].path), readText(omp_chunks[i].path)) << i;
    }
    removeChunks(seq_chunks);
    removeChunks(omp_chunks);
}

TEST_F(OpenMPTest, SessionOutputMatchesSequential) {
    SortConfig seq_cfg = config(200);
    SortSession sequential(seq_cfg);
    sequential.run(path("raw.txt"), path("seq.txt"));

    SortConfig omp_cfg = config(200);
    omp_cfg.num_threads = 3;
    SortSession parallel(omp_cfg);
    SortSummary summary = parallel.run(path("raw.txt"), path("omp.txt"));

    EXPECT_EQ(readText(path("seq.txt")), readText(path("omp.txt")));
    EXPECT_GT(summary.chunks, 3u);
    EXPECT_EQ(scratchFiles(), 0u);
}

TEST_F(OpenMPTest, EmptyInputYieldsNoChunks) {
    writeText("empty.txt", "");
    SortConfig cfg = config(64);
    cfg.num_threads = 2;
    EXPECT_TRUE(createSortedChunksOMP(path("empty.txt"), cfg, "omp").empty());
}

TEST_F(OpenMPTest, CancelledSpillLeavesNoChunks) {
    SortConfig cfg = config(64);
    cfg.num_threads = 2;
    std::atomic<bool> cancel{true};
    EXPECT_THROW(createSortedChunksOMP(path("clean.txt"), cfg, "omp", &cancel), SortCancelled);
    EXPECT_EQ(scratchFiles(), 0u);
}

TEST_F(OpenMPTest, WriteFailureRemovesChunks) {
    SortConfig cfg = config(64);
    cfg.num_threads = 2;
    cfg.temp_dir = path("missing_dir");
    EXPECT_THROW(createSortedChunksOMP(path("clean.txt"), cfg, "omp"), IOFailure);
    EXPECT_FALSE(fs::exists(path("missing_dir")));
}
