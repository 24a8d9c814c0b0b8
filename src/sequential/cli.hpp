#ifndef CLI_HPP
#define CLI_HPP
#include "record.hpp"
#include "session.hpp"
#include <string>
#include <vector>

constexpr size_t DEFAULT_MEMORY_SIZE_MBYTE = 1024;

struct CliOptions {
    std::vector<std::string> input_files;
    std::string output_file;
    SortConfig cfg;
    bool assume_yes = false;
};

// What differs between the sequential, OpenMP and FastFlow front ends.
struct ToolInfo {
    const char* name;
    const char* banner;
    int default_threads;
    SpillFunction spill;
};

// Returns false after printing a message when the arguments are unusable.
bool parseArgs(int argc, char* argv[], const ToolInfo& tool, CliOptions& opts);
size_t parseMemorySize(const char* argstr);
void printSummary(const SortSummary& summary, const CliOptions& opts);
int runCli(int argc, char* argv[], const ToolInfo& tool);

#endif
