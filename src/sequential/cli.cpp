#include "cli.hpp"
#include "sort_error.hpp"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

static void usage(const ToolInfo& tool) {
    std::cerr << "\n"
              << "Sort a large text file and remove duplicate lines.\n"
              << "\n"
              << "Usage: " << tool.name << " [options] <input_file> <output_file>\n"
              << "\n"
              << "Options:\n"
              << "  -m, --memory=<n>M, --memory=<n>G\n"
              << "        Memory budget for buffered lines. (default: " << DEFAULT_MEMORY_SIZE_MBYTE << " MiB)\n"
              << "  -T, --temporary-directory=DIR\n"
              << "        Directory for chunk files. (default: $TMPDIR/linesort)\n"
              << "  -a, --merge=FILE\n"
              << "        Also read FILE; may be repeated.\n"
              << "  -b, --blacklist=CHARS\n"
              << "        Drop lines containing any of CHARS.\n"
              << "  -k, --keep-duplicates\n"
              << "        Sort only, keep duplicate lines.\n"
              << "  -P, --parallel=N\n"
              << "        Sort chunks on N threads. (default: " << tool.default_threads << ")\n"
              << "  --no-clean     Input is already trimmed and has no empty lines.\n"
              << "  --no-verify    Skip the sortedness check of the output.\n"
              << "  --strict-merge Fail when a chunk cannot be read during the merge.\n"
              << "  -f, --force    Rebuild the output even if it is already sorted.\n"
              << "  -y, --yes      Continue when the temporary directory is low on space.\n"
              << "  -v, --verbose  Write progress messages.\n"
              << "\n";
}

static std::string defaultTempDir() {
    const char* tmpdir = std::getenv("TMPDIR");
    fs::path base = tmpdir != nullptr ? fs::path(tmpdir) : fs::path("/tmp");
    return (base / "linesort").string();
}

static bool parseThreads(const char* argstr, int& value) {
    char* endptr;
    errno = 0;
    long t = std::strtol(argstr, &endptr, 10);
    if (endptr == argstr || endptr[0] != '\0' || errno != 0 || t < 1 || t > 1024) {
        return false;
    }
    value = static_cast<int>(t);
    return true;
}

// "<n>M" or "<n>G"; returns 0 for an invalid size.
size_t parseMemorySize(const char* argstr) {
    char* endptr;
    errno = 0;
    long long value = std::strtoll(argstr, &endptr, 10);
    if (endptr == argstr || (endptr[0] != 'G' && endptr[0] != 'M') || endptr[1] != '\0') {
        return 0;
    }
    if (value <= 0 || errno != 0) {
        return 0;
    }
    size_t factor = endptr[0] == 'G' ? size_t(1024) * 1024 * 1024 : size_t(1024) * 1024;
    if (static_cast<unsigned long long>(value) > SIZE_MAX / factor) {
        return 0;
    }
    return static_cast<size_t>(value) * factor;
}

bool parseArgs(int argc, char* argv[], const ToolInfo& tool, CliOptions& opts) {
    enum { OPT_NO_CLEAN = 256, OPT_NO_VERIFY, OPT_STRICT_MERGE };
    const struct option longopts[] = {
        { "memory", 1, nullptr, 'm' },
        { "temporary-directory", 1, nullptr, 'T' },
        { "merge", 1, nullptr, 'a' },
        { "blacklist", 1, nullptr, 'b' },
        { "keep-duplicates", 0, nullptr, 'k' },
        { "parallel", 1, nullptr, 'P' },
        { "no-clean", 0, nullptr, OPT_NO_CLEAN },
        { "no-verify", 0, nullptr, OPT_NO_VERIFY },
        { "strict-merge", 0, nullptr, OPT_STRICT_MERGE },
        { "force", 0, nullptr, 'f' },
        { "yes", 0, nullptr, 'y' },
        { "verbose", 0, nullptr, 'v' },
        { "help", 0, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 }
    };

    opts.cfg.memory_budget_bytes = DEFAULT_MEMORY_SIZE_MBYTE * 1024 * 1024;
    opts.cfg.temp_dir = defaultTempDir();
    opts.cfg.num_threads = tool.default_threads;
    std::vector<std::string> extra_inputs;

    optind = 1;
    int opt;
    while ((opt = getopt_long(argc, argv, "m:T:a:b:kP:fyvh", longopts, nullptr)) != -1) {
        switch (opt) {
            case 'm':
                opts.cfg.memory_budget_bytes = parseMemorySize(optarg);
                if (opts.cfg.memory_budget_bytes == 0) {
                    std::cerr << "ERROR: Invalid memory size. Specify e.g. '--memory=800M' or '--memory=4G'.\n";
                    return false;
                }
                break;
            case 'T':
                opts.cfg.temp_dir = optarg;
                break;
            case 'a':
                extra_inputs.push_back(optarg);
                break;
            case 'b':
                opts.cfg.blacklist_chars = optarg;
                break;
            case 'k':
                opts.cfg.deduplicate = false;
                break;
            case 'P':
                if (!parseThreads(optarg, opts.cfg.num_threads)) {
                    std::cerr << "ERROR: Invalid number of threads\n";
                    return false;
                }
                break;
            case OPT_NO_CLEAN:
                opts.cfg.clean_input = false;
                break;
            case OPT_NO_VERIFY:
                opts.cfg.auto_verify = false;
                break;
            case OPT_STRICT_MERGE:
                opts.cfg.strict_merge = true;
                break;
            case 'f':
                opts.cfg.reuse_existing_output = false;
                break;
            case 'y':
                opts.assume_yes = true;
                break;
            case 'v':
                opts.cfg.verbose = true;
                break;
            case 'h':
            default:
                usage(tool);
                return false;
        }
    }

    if (argc != optind + 2) {
        std::cerr << "ERROR: Input and output file names must be specified\n";
        usage(tool);
        return false;
    }
    opts.input_files.push_back(argv[optind]);
    opts.input_files.insert(opts.input_files.end(), extra_inputs.begin(), extra_inputs.end());
    opts.output_file = argv[optind + 1];
    return true;
}

void printSummary(const SortSummary& summary, const CliOptions& opts) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    if (summary.reused_existing) {
        std::cout << "OUTPUT ALREADY SORTED, NOTHING TO DO\n"
                  << std::string(60, '=') << "\n"
                  << "Output file: " << opts.output_file << "\n"
                  << "Lines: " << summary.lines_out << "\n";
        return;
    }
    std::cout << "PROCESSING COMPLETE!\n" << std::string(60, '=') << "\n";
    for (const auto& input : opts.input_files) {
        std::cout << "Input file: " << input << "\n";
    }
    std::cout << "Output file: " << opts.output_file << "\n\n"
              << "Initial lines: " << summary.lines_in << "\n"
              << "Final lines: " << summary.lines_out << "\n"
              << "Empty lines removed: " << summary.emptyRemoved() << "\n"
              << "Duplicate lines removed: " << summary.duplicatesRemoved() << "\n"
              << "Total lines removed: " << summary.linesRemoved() << "\n";
    if (summary.lines_in > 0) {
        std::cout << "Compression: " << std::fixed << std::setprecision(2)
                  << 100.0 * summary.linesRemoved() / summary.lines_in << "% reduction\n";
    }
    std::cout << "Chunks: " << summary.chunks << (summary.resorted ? " (resorted once)" : "") << "\n";
    if (summary.merge_passes > 0) {
        std::cout << "Intermediate merge passes: " << summary.merge_passes << "\n";
    }
    if (!summary.failed_chunks.empty()) {
        std::cout << "Unreadable chunks skipped: " << summary.failed_chunks.size() << "\n";
    }
    std::cout << "\nTime taken: " << std::fixed << std::setprecision(2) << summary.elapsed_seconds << " s\n";
    if (summary.elapsed_seconds > 0) {
        std::cout << "Processing speed: " << std::setprecision(0)
                  << summary.lines_in / summary.elapsed_seconds << " lines/sec\n";
    }
}

int runCli(int argc, char* argv[], const ToolInfo& tool) {
    CliOptions opts;
    if (!parseArgs(argc, argv, tool, opts)) {
        return 1;
    }

    std::cout << "=== " << tool.banner << " ===" << std::endl;
    std::cout << "Output: " << opts.output_file << std::endl;
    std::cout << "Memory budget: " << opts.cfg.memory_budget_bytes / (1024 * 1024) << " MiB" << std::endl;
    std::cout << "Threads: " << opts.cfg.num_threads << std::endl;
    std::cout << "Temp directory: " << opts.cfg.temp_dir << std::endl;

    try {
        SortSession session(opts.cfg, tool.spill);
        if (opts.assume_yes) {
            session.setDiskSpaceConfirm([](const DiskSpaceShortfall&) { return true; });
        } else if (isatty(STDIN_FILENO)) {
            session.setDiskSpaceConfirm([](const DiskSpaceShortfall&) {
                std::cout << "Continue anyway? (y/n): " << std::flush;
                std::string answer;
                std::getline(std::cin, answer);
                return answer == "y" || answer == "Y";
            });
        }
        SortSummary summary = session.run(opts.input_files, opts.output_file);
        printSummary(summary, opts);
    } catch (const VerificationFailed& e) {
        std::cerr << "Sorting failed validation at line " << e.line() << ", output kept for inspection: "
                  << e.path() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
