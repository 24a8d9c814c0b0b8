#include "chunks_ff.hpp"
#include "../sequential/cli.hpp"
#include <algorithm>
#include <thread>

int main(int argc, char* argv[]) {
    int workers = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    ToolInfo tool{"linesort_ff", "FastFlow linesort", workers, createSortedChunksFF};
    return runCli(argc, argv, tool);
}
