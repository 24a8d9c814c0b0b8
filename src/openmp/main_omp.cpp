#include "../sequential/cli.hpp"
#include <omp.h>

int main(int argc, char* argv[]) {
    ToolInfo tool{"linesort_omp", "OpenMP linesort", omp_get_max_threads(), createSortedChunksOMP};
    return runCli(argc, argv, tool);
}
