#include "cli.hpp"

int main(int argc, char* argv[]) {
    ToolInfo tool{"linesort", "linesort: external sort and deduplicate", 1, nullptr};
    return runCli(argc, argv, tool);
}
